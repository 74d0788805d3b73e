#pragma once
#include <filesystem>
#include <string>
#include "AccessError.hpp"
#include "ResolvedPath.hpp"

class PathResolver {
public:
    // Canonicalize rawPath against the real filesystem (symlinks, '.', '..').
    // Relative input is only accepted together with a base directory.
    // Throws AccessError: InvalidPath, NotFound or IOError.
    static ResolvedPath resolve(const std::string& rawPath, const AllowedRoot* base = nullptr);

    // Best-effort canonical form for a path that may not exist: the existing
    // prefix is canonicalized, the rest normalized lexically. Never throws.
    // Only used to decide which error a failed lookup may report.
    static std::filesystem::path resolveNearest(const std::string& rawPath, const AllowedRoot* base = nullptr);

    // Re-canonicalize something that was resolved before (e.g. a root at
    // startup) to detect it being removed or replaced since.
    static ResolvedPath refresh(const ResolvedPath& previous);

private:
    static std::filesystem::path candidate(const std::string& rawPath, const AllowedRoot* base);
    static ResolvedPath canonicalize(const std::filesystem::path& candidate, const std::string& display);
};
