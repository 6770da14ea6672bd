#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace PK {

/**
 * Immutable, parsed filesystem path.
 *
 * A FilePath is an anchor (optional drive letter plus absolute/relative flag)
 * followed by an ordered list of non-empty segments. Both '/' and '\' are
 * accepted as separators when parsing; rendering always uses '/'. Dot segments
 * are stored literally, "a/../b" keeps its ".." segment.
 *
 * Every transformation returns a new FilePath. Operations that can fail
 * report through Expected instead of throwing.
 */
struct FilePath {
    FilePath() = default;
    FilePath(std::string_view path);
    FilePath(std::string const& path);
    FilePath(char const* const path);

    auto isRelative() const -> bool { return this->relative; }
    auto isAbsolute() const -> bool { return !this->relative; }
    auto driveLetter() const -> std::optional<char> { return this->drive; }
    auto segments() const -> std::vector<std::string> const& { return this->elements; }
    auto empty() const -> bool { return this->elements.empty(); }
    auto depth() const -> std::size_t { return this->elements.size(); }

    auto toString() const -> std::string;

    auto fileName() const -> Expected<std::string>;
    auto fileNameWithoutExtension() const -> Expected<std::string>;
    auto extensionWithDot() const -> Expected<std::string>;
    auto hasExtension(std::string_view extension) const -> bool;

    // Strings convert implicitly, so combine("a/b") parses before appending.
    auto combine(FilePath const& append) const -> Expected<FilePath>;

    template <typename First, typename Second, typename... Rest>
    auto combine(First const& first, Second const& second, Rest const&... rest) const -> Expected<FilePath> {
        auto head = this->combine(first);
        if (!head)
            return head;
        return head->combine(second, rest...);
    }

    auto parent() const -> Expected<FilePath>;
    auto up() const -> Expected<FilePath> { return this->parent(); }

    auto isBelowOrEqual(FilePath const& base) const -> bool;
    auto relativeTo(FilePath const& base) const -> Expected<FilePath>;

    auto equals(FilePath const& other) const -> bool;
    auto operator==(FilePath const& other) const -> bool { return this->equals(other); }
    auto hash() const -> std::size_t;

private:
    FilePath(std::vector<std::string> elements, bool relative, std::optional<char> drive);

    auto sameAnchor(FilePath const& other) const -> bool;

    std::vector<std::string> elements;
    bool                     relative = true;
    std::optional<char>      drive;
};

auto operator<<(std::ostream& os, FilePath const& path) -> std::ostream&;

} // namespace PK

namespace std {

template<>
struct hash<PK::FilePath> {
    std::size_t operator()(PK::FilePath const& path) const noexcept {
        return path.hash();
    }
};

} // namespace std
