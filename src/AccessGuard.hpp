#pragma once
#include <filesystem>
#include <string>
#include <utility>
#include "AccessConfig.hpp"
#include "AccessError.hpp"
#include "ResolvedPath.hpp"

// A resolved path together with the root it was attributed to.
class GuardedPath {
public:
    const ResolvedPath& resolved() const { return resolved_; }
    const std::filesystem::path& path() const { return resolved_.path(); }
    const AllowedRoot& root() const { return *root_; }

private:
    friend class AccessGuard;
    GuardedPath(ResolvedPath resolved, const AllowedRoot& root) : resolved_(std::move(resolved)), root_(&root) {}

    ResolvedPath resolved_;
    const AllowedRoot* root_;
};

// PathResolver followed by ContainmentChecker. The only way a request path
// reaches policy checks, enumeration or reading.
class AccessGuard {
public:
    explicit AccessGuard(const AccessConfig& config) : config_(config) {}

    // Throws AccessError. Lookups that fail for a location outside every
    // root report NotAllowed, not NotFound, so existence outside the
    // sandbox cannot be probed.
    GuardedPath guard(const std::string& rawPath) const;

    // Re-resolve a root and check it still lands on itself
    GuardedPath guardRoot(const AllowedRoot& root) const;

private:
    void requireConfigured() const;

    const AccessConfig& config_;
};
