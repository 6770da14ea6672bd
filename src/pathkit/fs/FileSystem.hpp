#pragma once
#include "core/Error.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <vector>

namespace PK {

/**
 * FileSystem is the only side-effecting boundary of PathKit. FileOps renders a
 * FilePath to a string right before calling into it and parses every string it
 * hands back.
 *
 * Implementations:
 * - createDir assumes the parent directory already exists.
 * - listFiles/listDirs return absolute path strings, sorted.
 * - Failures where the target is busy, locked or otherwise held by someone
 *   else are reported as Error::Code::IoConflict. DeleteMode::Soft relies on
 *   that distinction.
 */
struct FileSystem {
    virtual ~FileSystem() = default;

    virtual auto exists(std::string const& path) const -> bool = 0;
    virtual auto isFile(std::string const& path) const -> bool = 0;
    virtual auto isDir(std::string const& path) const -> bool  = 0;

    virtual auto createDir(std::string const& path) -> Expected<void>          = 0;
    virtual auto removeFile(std::string const& path) -> Expected<void>         = 0;
    virtual auto removeDirRecursive(std::string const& path) -> Expected<void> = 0;

    virtual auto listFiles(std::string const& path, bool recursive) const -> Expected<std::vector<std::string>> = 0;
    virtual auto listDirs(std::string const& path, bool recursive) const -> Expected<std::vector<std::string>>  = 0;

    virtual auto copyFile(std::string const& src, std::string const& dst, bool overwrite) -> Expected<void> = 0;
    virtual auto writeBytes(std::string const& path, std::span<const std::byte> bytes) -> Expected<void>    = 0;

    // Directory that temporary directories are allocated under.
    virtual auto tempPath() const -> Expected<std::string> = 0;
};

} // namespace PK
