#include "FileMetadata.hpp"
#include <sys/stat.h>
#include <cerrno>
#include <system_error>
#include "PolicyFilter.hpp"

FileStat FileStat::of(const ResolvedPath& path) {
    struct stat st;
    if (::stat(path.path().c_str(), &st) != 0) {
        std::error_code ec(errno, std::generic_category());
        if (ec == std::errc::no_such_file_or_directory) {
            throw AccessError(ErrorKind::NotFound, "File no longer exists: " + path.string());
        }
        throw AccessError(ErrorKind::IOError, "Cannot stat '" + path.string() + "': " + ec.message());
    }
    FileStat result;
    if (S_ISREG(st.st_mode)) {
        result.status = std::filesystem::file_status(std::filesystem::file_type::regular);
    } else if (S_ISDIR(st.st_mode)) {
        result.status = std::filesystem::file_status(std::filesystem::file_type::directory);
    } else {
        result.status = std::filesystem::file_status(std::filesystem::file_type::unknown);
    }
    result.identity.device = st.st_dev;
    result.identity.inode = st.st_ino;
    result.size = static_cast<std::uintmax_t>(st.st_size);
    // st_mtim rather than last_write_time(): file_clock has no portable
    // conversion to the system clock before C++20
    result.modified = static_cast<double>(st.st_mtim.tv_sec) + static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
    return result;
}

FileMetadata FileMetadata::describe(const std::filesystem::path& location, const ResolvedPath& resolved,
                                    const AllowedRoot& root, const PolicyConfig& policy) {
    FileStat st = FileStat::of(resolved);
    FileMetadata meta;
    meta.name = location.filename().string();
    meta.path = location.string();
    meta.relativePath = location.lexically_relative(root.path()).string();
    meta.size = st.size;
    meta.modified = st.modified;
    meta.extension = PolicyFilter::extensionOf(resolved.path());
    PolicyDecision decision = PolicyFilter::check(resolved, st.status, st.size, policy);
    if (!decision.accepted) {
        meta.restriction = decision.reason;
    }
    return meta;
}
