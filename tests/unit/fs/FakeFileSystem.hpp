#pragma once

#include "fs/FileSystem.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace PK::Test {

// In-memory FileSystem for exercising FileOps without touching disk. Paths
// are the canonical strings FileOps renders, rooted at "/".
class FakeFileSystem final : public FileSystem {
public:
    FakeFileSystem() { this->dirs.insert("/"); }

    auto exists(std::string const& path) const -> bool override {
        return this->isFile(path) || this->isDir(path);
    }
    auto isFile(std::string const& path) const -> bool override { return this->files.contains(path); }
    auto isDir(std::string const& path) const -> bool override { return this->dirs.contains(path); }

    auto createDir(std::string const& path) -> Expected<void> override {
        this->createdDirs.push_back(path);
        if (this->isDir(path))
            return {};
        if (this->isFile(path) || !this->isDir(parentOf(path)))
            return std::unexpected(Error{Error::Code::IoFailure, "cannot create " + path});
        this->dirs.insert(path);
        return {};
    }

    auto removeFile(std::string const& path) -> Expected<void> override {
        if (this->locked.contains(path))
            return std::unexpected(Error{Error::Code::IoConflict, "locked " + path});
        this->files.erase(path);
        return {};
    }

    auto removeDirRecursive(std::string const& path) -> Expected<void> override {
        for (auto const& lockedPath : this->locked) {
            if (lockedPath == path || isBelow(lockedPath, path))
                return std::unexpected(Error{Error::Code::IoConflict, "locked " + lockedPath});
        }
        std::erase_if(this->files, [&](auto const& entry) { return isBelow(entry.first, path); });
        std::erase_if(this->dirs, [&](auto const& dir) { return dir == path || isBelow(dir, path); });
        return {};
    }

    auto listFiles(std::string const& path, bool recursive) const -> Expected<std::vector<std::string>> override {
        if (!this->isDir(path))
            return std::unexpected(Error{Error::Code::IoFailure, "not a directory " + path});
        std::vector<std::string> result;
        for (auto const& [file, content] : this->files) {
            if (recursive ? isBelow(file, path) : parentOf(file) == path)
                result.push_back(file);
        }
        return result;
    }

    auto listDirs(std::string const& path, bool recursive) const -> Expected<std::vector<std::string>> override {
        if (!this->isDir(path))
            return std::unexpected(Error{Error::Code::IoFailure, "not a directory " + path});
        std::vector<std::string> result;
        for (auto const& dir : this->dirs) {
            if (dir != path && (recursive ? isBelow(dir, path) : parentOf(dir) == path))
                result.push_back(dir);
        }
        return result;
    }

    auto copyFile(std::string const& src, std::string const& dst, bool overwrite) -> Expected<void> override {
        if (!this->isFile(src))
            return std::unexpected(Error{Error::Code::IoFailure, "missing " + src});
        if (!overwrite && this->exists(dst))
            return std::unexpected(Error{Error::Code::IoFailure, "exists " + dst});
        if (!this->isDir(parentOf(dst)))
            return std::unexpected(Error{Error::Code::IoFailure, "no parent for " + dst});
        this->files[dst] = this->files.at(src);
        return {};
    }

    auto writeBytes(std::string const& path, std::span<const std::byte> bytes) -> Expected<void> override {
        if (!this->isDir(parentOf(path)))
            return std::unexpected(Error{Error::Code::IoFailure, "no parent for " + path});
        this->files[path] = std::string(reinterpret_cast<char const*>(bytes.data()), bytes.size());
        return {};
    }

    auto tempPath() const -> Expected<std::string> override { return this->temp; }

    auto addFile(std::string const& path, std::string content) -> void {
        for (auto dir = parentOf(path); !this->isDir(dir); dir = parentOf(dir))
            this->dirs.insert(dir);
        this->files[path] = std::move(content);
    }

    auto addDir(std::string const& path) -> void {
        for (auto dir = path; !this->isDir(dir); dir = parentOf(dir))
            this->dirs.insert(dir);
    }

    static auto parentOf(std::string const& path) -> std::string {
        auto const pos = path.rfind('/');
        if (pos == std::string::npos)
            return {};
        if (pos == 0)
            return "/";
        return path.substr(0, pos);
    }

    static auto isBelow(std::string const& path, std::string const& base) -> bool {
        auto const prefix = base == "/" ? base : base + "/";
        return path.size() > prefix.size() && path.starts_with(prefix);
    }

    std::map<std::string, std::string> files;
    std::set<std::string>              dirs;
    std::set<std::string>              locked;
    std::vector<std::string>           createdDirs;
    std::string                        temp = "/tmp";
};

} // namespace PK::Test
