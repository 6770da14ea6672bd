#pragma once
#include "fs/FileSystem.hpp"

#include <string_view>
#include <system_error>

namespace PK {

// FileSystem backed by std::filesystem. Never throws; every std::filesystem
// call goes through its std::error_code overload.
class LocalFileSystem final : public FileSystem {
public:
    static constexpr char const* kTempDirEnv = "PATHKIT_TMPDIR";

    auto exists(std::string const& path) const -> bool override;
    auto isFile(std::string const& path) const -> bool override;
    auto isDir(std::string const& path) const -> bool override;

    auto createDir(std::string const& path) -> Expected<void> override;
    auto removeFile(std::string const& path) -> Expected<void> override;
    auto removeDirRecursive(std::string const& path) -> Expected<void> override;

    auto listFiles(std::string const& path, bool recursive) const -> Expected<std::vector<std::string>> override;
    auto listDirs(std::string const& path, bool recursive) const -> Expected<std::vector<std::string>> override;

    auto copyFile(std::string const& src, std::string const& dst, bool overwrite) -> Expected<void> override;
    auto writeBytes(std::string const& path, std::span<const std::byte> bytes) -> Expected<void> override;

    auto tempPath() const -> Expected<std::string> override;
};

// Maps an OS error to IoConflict (busy/locked/denied) or IoFailure.
auto errorFromErrorCode(std::error_code const& ec, std::string_view operation, std::string_view path) -> Error;

} // namespace PK
