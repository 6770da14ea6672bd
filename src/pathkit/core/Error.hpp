#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace PK {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        InvalidCombination,
        EmptyPath,
        UnrelatedPaths,
        RelativePath,
        SourceNotFound,
        NotFound,
        IoConflict,
        IoFailure,
        InvalidArgument
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidCombination:
        return "invalid_combination";
    case Error::Code::EmptyPath:
        return "empty_path";
    case Error::Code::UnrelatedPaths:
        return "unrelated_paths";
    case Error::Code::RelativePath:
        return "relative_path";
    case Error::Code::SourceNotFound:
        return "source_not_found";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::IoConflict:
        return "io_conflict";
    case Error::Code::IoFailure:
        return "io_failure";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace PK
