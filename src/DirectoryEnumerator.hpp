#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "AccessConfig.hpp"
#include "AccessGuard.hpp"
#include "FileMetadata.hpp"

struct SubdirectoryEntry {
    std::string name;
    std::string path;
    std::string relativePath;
};

struct DirectoryListing {
    std::string directory;
    std::vector<FileMetadata> files;
    std::vector<SubdirectoryEntry> subdirectories;
    // The listing deadline expired before every entry was visited
    bool truncated = false;

    // Per-directory failure; files/subdirectories are empty when set
    std::optional<ErrorKind> errorKind;
    std::string error;
};

// Lists one directory level per call. Every entry is re-resolved and must
// land inside an allowed root to be shown; symlinks leading elsewhere,
// dangling links and special files are left out. Files the read gate would
// refuse are still listed, flagged through FileMetadata::restriction.
// Entries are sorted by name.
class DirectoryEnumerator {
public:
    explicit DirectoryEnumerator(const AccessConfig& config) : config_(config), guard_(config) {}

    // target == nullptr: every root in configured order; a failing root gets
    // an error entry and does not stop the others.
    // target != nullptr: that directory only; failures throw AccessError.
    // Deadline from the configured listing timeout, if any.
    std::vector<DirectoryListing> enumerate(const GuardedPath* target) const;
    // Explicit deadline: a directory still being read when it passes is
    // returned with truncated set; roots not yet started get an IOError entry.
    std::vector<DirectoryListing> enumerate(const GuardedPath* target,
                                            std::chrono::steady_clock::time_point deadline) const;

private:
    using Deadline = std::optional<std::chrono::steady_clock::time_point>;

    std::vector<DirectoryListing> enumerateUntil(const GuardedPath* target, const Deadline& deadline) const;

    DirectoryListing listDirectory(const GuardedPath& dir, const Deadline& deadline) const;
    Deadline startDeadline() const;
    static bool expired(const Deadline& deadline);

    const AccessConfig& config_;
    AccessGuard guard_;
};
