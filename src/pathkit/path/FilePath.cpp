#include "FilePath.hpp"

#include "path/path_utils.hpp"

#include <algorithm>
#include <ostream>
#include <utility>

namespace {

using PK::Error;
using PK::Expected;

struct ParsedFilePath {
    std::vector<std::string> elements;
    bool                     relative = true;
    std::optional<char>      drive;
};

auto parse_file_path(std::string_view raw) -> ParsedFilePath {
    auto const [drive, remainder] = PK::split_drive_letter(raw);
    auto const pieces             = PK::split_separators(remainder);

    ParsedFilePath parsed;
    parsed.drive    = drive;
    parsed.relative = pieces.empty() || !pieces.front().empty();
    parsed.elements.reserve(pieces.size());
    for (auto const piece : pieces) {
        if (!piece.empty())
            parsed.elements.emplace_back(piece);
    }
    return parsed;
}

auto empty_path_error(std::string_view operation) -> Error {
    std::string message{operation};
    message.append(" is called on an empty path");
    return Error{Error::Code::EmptyPath, std::move(message)};
}

[[nodiscard]] auto hash_combine(std::size_t seed, std::size_t value) -> std::size_t {
    constexpr std::size_t kMagic = 0x9e3779b97f4a7c15ULL;
    seed ^= value + kMagic + (seed << 6U) + (seed >> 2U);
    return seed;
}

} // namespace

namespace PK {

FilePath::FilePath(std::string_view path) {
    auto parsed    = parse_file_path(path);
    this->elements = std::move(parsed.elements);
    this->relative = parsed.relative;
    this->drive    = parsed.drive;
}

FilePath::FilePath(std::string const& path) : FilePath(std::string_view{path}) {}

FilePath::FilePath(char const* const path) : FilePath(std::string_view{path}) {}

FilePath::FilePath(std::vector<std::string> elements, bool relative, std::optional<char> drive)
    : elements(std::move(elements)), relative(relative), drive(drive) {}

auto FilePath::toString() const -> std::string {
    std::string result;
    if (this->drive) {
        result.push_back(*this->drive);
        result.push_back(':');
    }
    if (!this->relative)
        result.push_back('/');
    bool first = true;
    for (auto const& element : this->elements) {
        if (!first)
            result.push_back('/');
        result.append(element);
        first = false;
    }
    return result;
}

auto FilePath::fileName() const -> Expected<std::string> {
    if (this->elements.empty())
        return std::unexpected(empty_path_error("fileName()"));
    return this->elements.back();
}

auto FilePath::fileNameWithoutExtension() const -> Expected<std::string> {
    if (this->elements.empty())
        return std::unexpected(empty_path_error("fileNameWithoutExtension()"));
    auto const& last  = this->elements.back();
    auto const  index = last.rfind('.');
    if (index == std::string::npos)
        return last;
    return last.substr(0, index);
}

auto FilePath::extensionWithDot() const -> Expected<std::string> {
    if (this->elements.empty())
        return std::unexpected(empty_path_error("extensionWithDot()"));
    auto const& last  = this->elements.back();
    auto const  index = last.rfind('.');
    if (index == std::string::npos)
        return std::string{};
    return last.substr(index);
}

auto FilePath::hasExtension(std::string_view extension) const -> bool {
    auto const current = this->extensionWithDot();
    if (!current)
        return false;
    std::string withDot;
    if (!extension.starts_with('.'))
        withDot.push_back('.');
    withDot.append(extension);
    return *current == withDot;
}

auto FilePath::combine(FilePath const& append) const -> Expected<FilePath> {
    if (!append.relative)
        return std::unexpected(Error{Error::Code::InvalidCombination,
                                     "Cannot combine with a non-relative path: " + append.toString()});

    std::vector<std::string> combined;
    combined.reserve(this->elements.size() + append.elements.size());
    combined.insert(combined.end(), this->elements.begin(), this->elements.end());
    combined.insert(combined.end(), append.elements.begin(), append.elements.end());
    return FilePath{std::move(combined), this->relative, this->drive};
}

auto FilePath::parent() const -> Expected<FilePath> {
    if (this->elements.empty())
        return std::unexpected(empty_path_error("parent()"));

    std::vector<std::string> truncated(this->elements.begin(), this->elements.end() - 1);
    return FilePath{std::move(truncated), this->relative, this->drive};
}

auto FilePath::sameAnchor(FilePath const& other) const -> bool {
    return this->relative == other.relative && this->drive == other.drive;
}

// Equivalent to walking parent() until the path matches base or runs out of
// segments. Only non-empty prefixes count, so nothing is below an empty base.
auto FilePath::isBelowOrEqual(FilePath const& base) const -> bool {
    if (this->elements.empty() || base.elements.empty())
        return false;
    if (!this->sameAnchor(base))
        return false;
    if (base.elements.size() > this->elements.size())
        return false;
    return std::equal(base.elements.begin(), base.elements.end(), this->elements.begin());
}

auto FilePath::relativeTo(FilePath const& base) const -> Expected<FilePath> {
    if (!this->isBelowOrEqual(base))
        return std::unexpected(Error{Error::Code::UnrelatedPaths,
                                     "relativeTo() was invoked with two paths that are unrelated. invoked on: "
                                         + this->toString() + " asked to be made relative to: " + base.toString()});

    std::vector<std::string> remaining(this->elements.begin() + static_cast<std::ptrdiff_t>(base.elements.size()),
                                       this->elements.end());
    return FilePath{std::move(remaining), true, std::nullopt};
}

auto FilePath::equals(FilePath const& other) const -> bool {
    return this->sameAnchor(other) && this->elements == other.elements;
}

auto FilePath::hash() const -> std::size_t {
    std::size_t seed = std::hash<bool>{}(this->relative);
    seed             = hash_combine(seed, this->drive ? std::hash<char>{}(*this->drive) + 1 : 0);
    for (auto const& element : this->elements)
        seed = hash_combine(seed, std::hash<std::string>{}(element));
    return seed;
}

auto operator<<(std::ostream& os, FilePath const& path) -> std::ostream& {
    return os << path.toString();
}

} // namespace PK
