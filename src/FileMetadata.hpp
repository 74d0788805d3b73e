#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <sys/types.h>
#include "AccessConfig.hpp"
#include "AccessError.hpp"
#include "ResolvedPath.hpp"

struct FileMetadata {
    std::string name;
    std::string path;          // absolute
    std::string relativePath;  // relative to the owning root
    std::uintmax_t size = 0;
    double modified = 0;       // seconds since the Unix epoch
    // Taken from the file that would be read: for a symlink, its target
    std::string extension;
    // Set when the read gate would refuse the file (FileTooLarge, ExtensionNotAllowed)
    std::optional<ErrorKind> restriction;

    bool readable() const { return !restriction; }

    // location is where the file was found (may be a symlink), resolved is
    // its canonical target. Size, time, extension and policy come from the
    // target; name and paths from location.
    static FileMetadata describe(const std::filesystem::path& location, const ResolvedPath& resolved,
                                 const AllowedRoot& root, const PolicyConfig& policy);
};

// Which file an open handle or a path refers to
struct FileIdentity {
    dev_t device = 0;
    ino_t inode = 0;

    bool operator==(const FileIdentity& other) const { return device == other.device && inode == other.inode; }
    bool operator!=(const FileIdentity& other) const { return !(*this == other); }
};

// size and mtime of the file behind path, following symlinks
struct FileStat {
    std::filesystem::file_status status;
    FileIdentity identity;
    std::uintmax_t size = 0;
    double modified = 0;

    static FileStat of(const ResolvedPath& path);
};
