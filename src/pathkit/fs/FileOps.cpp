#include "FileOps.hpp"

#include "log/TaggedLogger.hpp"

#include <iterator>
#include <string>
#include <utility>

namespace {

using PK::Error;
using PK::Expected;
using PK::FilePath;

auto require_absolute(FilePath const& path, std::string_view operation) -> Expected<void> {
    if (path.isRelative()) {
        std::string message{operation};
        message.append(" requires an absolute path, but the path is relative: ");
        message.append(path.toString());
        return std::unexpected(Error{Error::Code::RelativePath, std::move(message)});
    }
    return {};
}

auto wrap_paths(Expected<std::vector<std::string>> listed) -> Expected<std::vector<FilePath>> {
    if (!listed)
        return std::unexpected(listed.error());
    std::vector<FilePath> paths;
    paths.reserve(listed->size());
    for (auto const& entry : *listed)
        paths.emplace_back(entry);
    return paths;
}

auto is_recursive(PK::Fs::Recursion recursion) -> bool {
    return recursion == PK::Fs::Recursion::AllDirectories;
}

} // namespace

namespace PK::Fs {

auto exists(FileSystem const& fs, FilePath const& path) -> bool {
    return fileExists(fs, path) || directoryExists(fs, path);
}

auto fileExists(FileSystem const& fs, FilePath const& path) -> bool {
    return fs.isFile(path.toString());
}

auto directoryExists(FileSystem const& fs, FilePath const& path) -> bool {
    return fs.isDir(path.toString());
}

// Walks up until an existing directory is found, then creates the missing
// chain top-down. Runs out of segments only when not even the root exists.
auto ensureDirectoryExists(FileSystem& fs, FilePath const& directory) -> Expected<void> {
    std::vector<FilePath> missing;
    FilePath              current = directory;
    while (!directoryExists(fs, current)) {
        auto parent = current.parent();
        if (!parent)
            return std::unexpected(Error{Error::Code::EmptyPath,
                                         "No existing ancestor directory for " + directory.toString()});
        missing.push_back(current);
        current = std::move(*parent);
    }

    for (auto it = missing.rbegin(); it != missing.rend(); ++it) {
        pk_log("Creating directory " + it->toString(), "FileOps");
        if (auto created = fs.createDir(it->toString()); !created)
            return created;
    }
    return {};
}

auto createFile(FileSystem& fs, FilePath const& path) -> Expected<FilePath> {
    if (auto absolute = require_absolute(path, "createFile()"); !absolute)
        return std::unexpected(absolute.error());

    auto parent = path.parent();
    if (!parent)
        return std::unexpected(parent.error());
    if (auto ensured = ensureDirectoryExists(fs, *parent); !ensured)
        return std::unexpected(ensured.error());

    if (auto written = fs.writeBytes(path.toString(), {}); !written)
        return std::unexpected(written.error());
    return path;
}

auto createDirectory(FileSystem& fs, FilePath const& path) -> Expected<FilePath> {
    if (auto absolute = require_absolute(path, "createDirectory()"); !absolute)
        return std::unexpected(absolute.error());
    if (auto ensured = ensureDirectoryExists(fs, path); !ensured)
        return std::unexpected(ensured.error());
    return path;
}

auto copy(FileSystem& fs, FilePath const& src, FilePath const& dst, CopyFilter const& filter) -> Expected<void> {
    if (auto absolute = require_absolute(src, "copy()"); !absolute)
        return absolute;
    if (auto absolute = require_absolute(dst, "copy() destination"); !absolute)
        return absolute;

    if (filter && !filter(dst)) {
        pk_log("Copy filter rejected " + dst.toString(), "FileOps");
        return {};
    }

    if (fileExists(fs, src)) {
        auto parent = dst.parent();
        if (!parent)
            return std::unexpected(parent.error());
        if (auto ensured = ensureDirectoryExists(fs, *parent); !ensured)
            return ensured;
        pk_log("Copying " + src.toString() + " to " + dst.toString(), "FileOps");
        return fs.copyFile(src.toString(), dst.toString(), true);
    }

    if (directoryExists(fs, src)) {
        if (auto ensured = ensureDirectoryExists(fs, dst); !ensured)
            return ensured;
        auto children = contents(fs, src);
        if (!children)
            return std::unexpected(children.error());
        for (auto const& child : *children) {
            auto relative = child.relativeTo(src);
            if (!relative)
                return std::unexpected(relative.error());
            auto target = dst.combine(*relative);
            if (!target)
                return std::unexpected(target.error());
            if (auto copied = Fs::copy(fs, child, *target, filter); !copied)
                return copied;
        }
        return {};
    }

    return std::unexpected(Error{Error::Code::SourceNotFound,
                                 "copy() called on path that does not exist: " + src.toString()});
}

auto remove(FileSystem& fs, FilePath const& path, DeleteMode mode) -> Expected<void> {
    if (auto absolute = require_absolute(path, "remove()"); !absolute)
        return absolute;

    if (fileExists(fs, path))
        return fs.removeFile(path.toString());

    if (directoryExists(fs, path)) {
        auto removed = fs.removeDirRecursive(path.toString());
        if (!removed && mode == DeleteMode::Soft && removed.error().code == Error::Code::IoConflict) {
            pk_log("Soft delete ignored " + describeError(removed.error()), "FileOps", "WARN");
            return {};
        }
        return removed;
    }

    return std::unexpected(Error{Error::Code::NotFound,
                                 "Trying to delete a path that does not exist: " + path.toString()});
}

auto files(FileSystem const& fs, FilePath const& path, Recursion recursion) -> Expected<std::vector<FilePath>> {
    return wrap_paths(fs.listFiles(path.toString(), is_recursive(recursion)));
}

auto files(FileSystem const& fs, FilePath const& path, PathFilter const& filter) -> Expected<std::vector<FilePath>> {
    auto all = files(fs, path);
    if (!all || !filter)
        return all;
    std::vector<FilePath> kept;
    for (auto& entry : *all) {
        if (filter(entry))
            kept.push_back(std::move(entry));
    }
    return kept;
}

auto directories(FileSystem const& fs, FilePath const& path, Recursion recursion) -> Expected<std::vector<FilePath>> {
    return wrap_paths(fs.listDirs(path.toString(), is_recursive(recursion)));
}

auto contents(FileSystem const& fs, FilePath const& path, Recursion recursion) -> Expected<std::vector<FilePath>> {
    auto result = files(fs, path, recursion);
    if (!result)
        return result;
    auto dirs = directories(fs, path, recursion);
    if (!dirs)
        return dirs;
    result->insert(result->end(), std::make_move_iterator(dirs->begin()), std::make_move_iterator(dirs->end()));
    return result;
}

auto createTempDirectory(FileSystem& fs, std::string_view prefix, RandomSource const& random) -> Expected<FilePath> {
    if (!random)
        return std::unexpected(Error{Error::Code::InvalidArgument, "createTempDirectory() needs a random source"});
    auto root = fs.tempPath();
    if (!root)
        return std::unexpected(root.error());

    while (true) {
        std::string name{*root};
        name.push_back('/');
        name.append(prefix);
        name.push_back('_');
        name.append(std::to_string(random()));
        FilePath candidate{name};
        if (!exists(fs, candidate))
            return createDirectory(fs, candidate);
        pk_log("Temp directory name taken: " + candidate.toString(), "FileOps");
    }
}

auto createTempDirectory(FileSystem& fs, std::string_view prefix) -> Expected<FilePath> {
    return createTempDirectory(fs, prefix, makeRandomSource());
}

} // namespace PK::Fs
