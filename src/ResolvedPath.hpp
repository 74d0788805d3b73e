#pragma once
#include <filesystem>
#include <string>
#include <utility>

// Canonical absolute path produced by PathResolver. There is no public
// constructor: a raw string can only become a ResolvedPath by going through
// the filesystem.
class ResolvedPath {
public:
    const std::filesystem::path& path() const { return path_; }
    std::string string() const { return path_.string(); }

    bool operator==(const ResolvedPath& other) const { return path_ == other.path_; }
    bool operator!=(const ResolvedPath& other) const { return path_ != other.path_; }

private:
    friend class PathResolver;
    explicit ResolvedPath(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

// A configured directory boundary. Built once at startup from a ResolvedPath
// that was verified to be a directory.
class AllowedRoot {
public:
    AllowedRoot(ResolvedPath resolved, std::string configured)
        : resolved_(std::move(resolved)), configured_(std::move(configured)) {}

    const std::filesystem::path& path() const { return resolved_.path(); }
    const ResolvedPath& resolved() const { return resolved_; }
    // The directory string as it appeared in the configuration
    const std::string& configured() const { return configured_; }

private:
    ResolvedPath resolved_;
    std::string configured_;
};
