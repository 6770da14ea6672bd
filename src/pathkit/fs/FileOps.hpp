#pragma once
#include "core/Error.hpp"
#include "fs/FileSystem.hpp"
#include "fs/RandomSource.hpp"
#include "path/FilePath.hpp"

#include <functional>
#include <string_view>
#include <vector>

namespace PK::Fs {

enum class DeleteMode {
    Normal, // Propagate every failure.
    Soft    // Ignore IoConflict while removing a directory tree.
};

enum class Recursion {
    TopDirectoryOnly,
    AllDirectories
};

// Called with each destination before it is written. Returning false skips
// that destination, and for a directory its whole subtree.
using CopyFilter = std::function<bool(FilePath const&)>;
using PathFilter = std::function<bool(FilePath const&)>;

auto exists(FileSystem const& fs, FilePath const& path) -> bool;
auto fileExists(FileSystem const& fs, FilePath const& path) -> bool;
auto directoryExists(FileSystem const& fs, FilePath const& path) -> bool;

/**
 * Creates an empty file at path, creating missing parent directories first.
 * An existing file is truncated. Fails with RelativePath for relative paths
 * and EmptyPath when no ancestor of path exists as a directory.
 */
auto createFile(FileSystem& fs, FilePath const& path) -> Expected<FilePath>;

// Creates path and any missing ancestors. Succeeds if the directory exists.
auto createDirectory(FileSystem& fs, FilePath const& path) -> Expected<FilePath>;

auto ensureDirectoryExists(FileSystem& fs, FilePath const& directory) -> Expected<void>;

/**
 * Copies a file or a directory tree from src to dst.
 *
 * Files overwrite an existing destination. Directories are merged into dst,
 * each child landing at dst.combine(child.relativeTo(src)). Both paths must
 * be absolute. A source that is neither file nor directory fails with
 * SourceNotFound. A failure partway leaves whatever was already copied.
 */
auto copy(FileSystem& fs, FilePath const& src, FilePath const& dst, CopyFilter const& filter = {}) -> Expected<void>;

auto remove(FileSystem& fs, FilePath const& path, DeleteMode mode = DeleteMode::Normal) -> Expected<void>;

auto files(FileSystem const& fs, FilePath const& path, Recursion recursion = Recursion::TopDirectoryOnly)
        -> Expected<std::vector<FilePath>>;
auto files(FileSystem const& fs, FilePath const& path, PathFilter const& filter) -> Expected<std::vector<FilePath>>;
auto directories(FileSystem const& fs, FilePath const& path, Recursion recursion = Recursion::TopDirectoryOnly)
        -> Expected<std::vector<FilePath>>;
// Files first, then directories.
auto contents(FileSystem const& fs, FilePath const& path, Recursion recursion = Recursion::TopDirectoryOnly)
        -> Expected<std::vector<FilePath>>;

// Creates <tempPath>/<prefix>_<n>, drawing n from random until the name is free.
auto createTempDirectory(FileSystem& fs, std::string_view prefix, RandomSource const& random) -> Expected<FilePath>;
auto createTempDirectory(FileSystem& fs, std::string_view prefix) -> Expected<FilePath>;

} // namespace PK::Fs
