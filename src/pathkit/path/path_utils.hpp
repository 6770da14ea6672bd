#pragma once
#include <optional>
#include <string_view>
#include <vector>

namespace PK {

struct DriveSplit {
    std::optional<char> drive;
    std::string_view    remainder;
};

// "X:rest" yields drive 'X' and "rest"; anything else is returned untouched.
auto split_drive_letter(std::string_view path) -> DriveSplit;

// Splits on both '/' and '\'. Empty pieces are kept so callers can tell a
// leading separator apart from a relative start.
auto split_separators(std::string_view path) -> std::vector<std::string_view>;

constexpr auto is_separator(char ch) -> bool {
    return ch == '/' || ch == '\\';
}

} // namespace PK
