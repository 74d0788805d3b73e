#include "DirectoryEnumerator.hpp"
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>
#include "ContainmentChecker.hpp"
#include "PathResolver.hpp"

namespace fs = std::filesystem;

namespace {

void addEntry(DirectoryListing& listing, const GuardedPath& dir, const fs::path& location,
              const AccessConfig& config) {
    ResolvedPath resolved = PathResolver::resolve(location.string());
    if (!ContainmentChecker::findRoot(resolved.path(), config.roots())) {
        return;
    }
    FileStat st = FileStat::of(resolved);
    if (fs::is_regular_file(st.status)) {
        listing.files.push_back(FileMetadata::describe(location, resolved, dir.root(), config.policy()));
    } else if (fs::is_directory(st.status)) {
        listing.subdirectories.push_back({location.filename().string(), location.string(),
                                          location.lexically_relative(dir.root().path()).string()});
    }
}

}  // namespace

DirectoryEnumerator::Deadline DirectoryEnumerator::startDeadline() const {
    if (config_.listTimeout().count() <= 0) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::now() + config_.listTimeout();
}

bool DirectoryEnumerator::expired(const Deadline& deadline) {
    return deadline && std::chrono::steady_clock::now() >= *deadline;
}

DirectoryListing DirectoryEnumerator::listDirectory(const GuardedPath& dir, const Deadline& deadline) const {
    DirectoryListing listing;
    listing.directory = dir.path().string();

    std::error_code ec;
    fs::directory_iterator it(dir.path(), ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            throw AccessError(ErrorKind::NotFound, "Directory does not exist");
        }
        if (ec == std::errc::not_a_directory) {
            throw AccessError(ErrorKind::InvalidPath, "Path is not a directory");
        }
        throw AccessError(ErrorKind::IOError, "Cannot list directory: " + ec.message());
    }

    const fs::directory_iterator end;
    while (it != end) {
        if (expired(deadline)) {
            listing.truncated = true;
            break;
        }
        try {
            addEntry(listing, dir, dir.path() / it->path().filename(), config_);
        } catch (const AccessError&) {
            // dangling symlink, or the entry vanished while listing: not shown
        }
        it.increment(ec);
        if (ec) {
            throw AccessError(ErrorKind::IOError, "Error while listing directory: " + ec.message());
        }
    }

    std::sort(listing.files.begin(), listing.files.end(),
              [](const FileMetadata& a, const FileMetadata& b) { return a.name < b.name; });
    std::sort(listing.subdirectories.begin(), listing.subdirectories.end(),
              [](const SubdirectoryEntry& a, const SubdirectoryEntry& b) { return a.name < b.name; });
    return listing;
}

std::vector<DirectoryListing> DirectoryEnumerator::enumerate(const GuardedPath* target) const {
    return enumerateUntil(target, startDeadline());
}

std::vector<DirectoryListing> DirectoryEnumerator::enumerate(const GuardedPath* target,
                                                             std::chrono::steady_clock::time_point deadline) const {
    return enumerateUntil(target, Deadline(deadline));
}

std::vector<DirectoryListing> DirectoryEnumerator::enumerateUntil(const GuardedPath* target,
                                                                  const Deadline& deadline) const {
    if (config_.status() != ConfigStatus::Configured) {
        throw AccessError(ErrorKind::NotConfigured, config_.statusMessage());
    }
    std::vector<DirectoryListing> listings;

    if (target) {
        std::error_code ec;
        if (!fs::is_directory(target->path(), ec)) {
            throw AccessError(ErrorKind::InvalidPath, "Path is not a directory");
        }
        listings.push_back(listDirectory(*target, deadline));
        return listings;
    }

    for (const auto& root : config_.roots()) {
        DirectoryListing listing;
        try {
            if (expired(deadline)) {
                throw AccessError(ErrorKind::IOError, "Listing deadline exceeded");
            }
            listing = listDirectory(guard_.guardRoot(root), deadline);
        } catch (const AccessError& e) {
            listing = DirectoryListing();
            listing.directory = root.path().string();
            listing.errorKind = e.kind();
            listing.error = e.what();
        }
        listings.push_back(std::move(listing));
    }
    return listings;
}
