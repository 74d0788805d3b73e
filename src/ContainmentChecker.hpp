#pragma once
#include <filesystem>
#include <vector>
#include "AccessError.hpp"
#include "ResolvedPath.hpp"

class ContainmentChecker {
public:
    // True if candidate equals root or lies below it. Both must be canonical.
    // Separator-bounded: "/home/user2" is not inside "/home/user".
    static bool contains(const std::filesystem::path& root, const std::filesystem::path& candidate);

    // The most specific root containing resolved (longest root path; equal
    // roots resolve to the first configured). Throws NotAllowed otherwise.
    static const AllowedRoot& isContained(const ResolvedPath& resolved, const std::vector<AllowedRoot>& roots);

    // Same lookup without throwing, for canonical paths that did not come out
    // of PathResolver::resolve (nearest-existing forms, enumeration entries).
    static const AllowedRoot* findRoot(const std::filesystem::path& canonical, const std::vector<AllowedRoot>& roots);
};
