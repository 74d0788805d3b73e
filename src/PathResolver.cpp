#include "PathResolver.hpp"
#include <system_error>

namespace fs = std::filesystem;

fs::path PathResolver::candidate(const std::string& rawPath, const AllowedRoot* base) {
    if (rawPath.empty()) {
        throw AccessError(ErrorKind::InvalidPath, "Path must not be empty");
    }
    if (rawPath.find('\0') != std::string::npos) {
        throw AccessError(ErrorKind::InvalidPath, "Path contains a NUL character");
    }
    fs::path p(rawPath);
    if (p.is_absolute()) {
        return p;
    }
    if (!base) {
        throw AccessError(ErrorKind::InvalidPath, "Relative path '" + rawPath + "' requires an absolute path");
    }
    return base->path() / p;
}

ResolvedPath PathResolver::canonicalize(const fs::path& candidate, const std::string& display) {
    std::error_code ec;
    fs::path canonical = fs::canonical(candidate, ec);
    if (!ec) {
        return ResolvedPath(canonical);
    }
    // ENOTDIR: a file used as a directory component ("/data/a.txt/x")
    // ELOOP: symlink cycle, nothing can exist at the end of it
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory ||
        ec == std::errc::too_many_symbolic_link_levels) {
        throw AccessError(ErrorKind::NotFound, "Path does not exist: " + display);
    }
    if (ec == std::errc::filename_too_long) {
        throw AccessError(ErrorKind::InvalidPath, "Path is too long");
    }
    throw AccessError(ErrorKind::IOError, "Cannot resolve '" + display + "': " + ec.message());
}

ResolvedPath PathResolver::resolve(const std::string& rawPath, const AllowedRoot* base) {
    return canonicalize(candidate(rawPath, base), rawPath);
}

fs::path PathResolver::resolveNearest(const std::string& rawPath, const AllowedRoot* base) {
    fs::path p;
    try {
        p = candidate(rawPath, base);
    } catch (const AccessError&) {
        return fs::path();
    }
    std::error_code ec;
    fs::path nearest = fs::weakly_canonical(p, ec);
    if (ec) {
        return p.lexically_normal();
    }
    return nearest;
}

ResolvedPath PathResolver::refresh(const ResolvedPath& previous) {
    return canonicalize(previous.path(), previous.string());
}
