#include "path_utils.hpp"

namespace PK {

auto split_drive_letter(std::string_view path) -> DriveSplit {
    if (path.size() >= 2 && path[1] == ':') {
        return DriveSplit{path[0], path.substr(2)};
    }
    return DriveSplit{std::nullopt, path};
}

auto split_separators(std::string_view path) -> std::vector<std::string_view> {
    std::vector<std::string_view> pieces;
    if (path.empty()) {
        return pieces;
    }

    std::size_t start = 0;
    for (std::size_t idx = 0; idx < path.size(); ++idx) {
        if (is_separator(path[idx])) {
            pieces.push_back(path.substr(start, idx - start));
            start = idx + 1;
        }
    }
    pieces.push_back(path.substr(start));
    return pieces;
}

} // namespace PK
