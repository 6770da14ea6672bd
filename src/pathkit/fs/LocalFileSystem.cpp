#include "LocalFileSystem.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace {

namespace fs = std::filesystem;

auto is_conflict(std::error_code const& ec) -> bool {
    if (ec.category() != std::generic_category() && ec.category() != std::system_category())
        return false;
    auto const condition = ec.default_error_condition();
    return condition == std::errc::device_or_resource_busy
           || condition == std::errc::text_file_busy
           || condition == std::errc::permission_denied
           || condition == std::errc::operation_not_permitted
           || condition == std::errc::directory_not_empty
           || condition == std::errc::resource_unavailable_try_again;
}

auto to_generic(fs::path const& path) -> std::string {
    return path.generic_string();
}

template <typename Predicate>
auto list_entries(std::string const& root, bool recursive, Predicate keep) -> PK::Expected<std::vector<std::string>> {
    std::error_code          ec;
    std::vector<std::string> entries;
    if (recursive) {
        fs::recursive_directory_iterator it{root, ec};
        if (ec)
            return std::unexpected(PK::errorFromErrorCode(ec, "list", root));
        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec)
                return std::unexpected(PK::errorFromErrorCode(ec, "list", root));
            if (keep(*it))
                entries.push_back(to_generic(it->path()));
        }
    } else {
        fs::directory_iterator it{root, ec};
        if (ec)
            return std::unexpected(PK::errorFromErrorCode(ec, "list", root));
        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec)
                return std::unexpected(PK::errorFromErrorCode(ec, "list", root));
            if (keep(*it))
                entries.push_back(to_generic(it->path()));
        }
    }
    std::ranges::sort(entries);
    return entries;
}

} // namespace

namespace PK {

auto errorFromErrorCode(std::error_code const& ec, std::string_view operation, std::string_view path) -> Error {
    std::string message{operation};
    message.append(" '");
    message.append(path);
    message.append("': ");
    message.append(ec.message());
    return Error{is_conflict(ec) ? Error::Code::IoConflict : Error::Code::IoFailure, std::move(message)};
}

auto LocalFileSystem::exists(std::string const& path) const -> bool {
    std::error_code ec;
    return fs::exists(path, ec);
}

auto LocalFileSystem::isFile(std::string const& path) const -> bool {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

auto LocalFileSystem::isDir(std::string const& path) const -> bool {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

auto LocalFileSystem::createDir(std::string const& path) -> Expected<void> {
    std::error_code ec;
    fs::create_directory(path, ec);
    if (ec)
        return std::unexpected(errorFromErrorCode(ec, "create_directory", path));
    return {};
}

auto LocalFileSystem::removeFile(std::string const& path) -> Expected<void> {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec)
        return std::unexpected(errorFromErrorCode(ec, "remove", path));
    return {};
}

auto LocalFileSystem::removeDirRecursive(std::string const& path) -> Expected<void> {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
        return std::unexpected(errorFromErrorCode(ec, "remove_all", path));
    return {};
}

auto LocalFileSystem::listFiles(std::string const& path, bool recursive) const -> Expected<std::vector<std::string>> {
    return list_entries(path, recursive, [](fs::directory_entry const& entry) {
        std::error_code ec;
        return entry.is_regular_file(ec);
    });
}

auto LocalFileSystem::listDirs(std::string const& path, bool recursive) const -> Expected<std::vector<std::string>> {
    return list_entries(path, recursive, [](fs::directory_entry const& entry) {
        std::error_code ec;
        return entry.is_directory(ec);
    });
}

auto LocalFileSystem::copyFile(std::string const& src, std::string const& dst, bool overwrite) -> Expected<void> {
    std::error_code ec;
    auto const      options = overwrite ? fs::copy_options::overwrite_existing : fs::copy_options::none;
    fs::copy_file(src, dst, options, ec);
    if (ec)
        return std::unexpected(errorFromErrorCode(ec, "copy_file", src));
    return {};
}

auto LocalFileSystem::writeBytes(std::string const& path, std::span<const std::byte> bytes) -> Expected<void> {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to open for writing: " + path});
    out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!out)
        return std::unexpected(Error{Error::Code::IoFailure, "Failed to write: " + path});
    return {};
}

auto LocalFileSystem::tempPath() const -> Expected<std::string> {
    if (auto const* overridden = std::getenv(kTempDirEnv); overridden != nullptr && overridden[0] != '\0') {
        pk_log("Temp root overridden by " + std::string{kTempDirEnv}, "LocalFileSystem", "INFO");
        return std::string{overridden};
    }
    std::error_code ec;
    auto            temp = fs::temp_directory_path(ec);
    if (ec)
        return std::unexpected(errorFromErrorCode(ec, "temp_directory_path", ""));
    return to_generic(temp);
}

} // namespace PK
