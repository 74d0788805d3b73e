#include "MemorySegment.hpp"
#include <boost/interprocess/exceptions.hpp>
#include <sys/stat.h>
#include <cerrno>
#include <filesystem>
#include <system_error>
#include "AccessError.hpp"

MemorySegment::MemorySegment(const ResolvedPath& path) : segmentSize(0) {
    namespace bip = boost::interprocess;
    std::error_code ec;
    auto size = std::filesystem::file_size(path.path(), ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            throw AccessError(ErrorKind::NotFound, "File no longer exists: " + path.string());
        }
        throw AccessError(ErrorKind::IOError, "Cannot stat '" + path.string() + "': " + ec.message());
    }
    if (size == 0) {
        return;
    }
    try {
        bip::file_mapping mapping(path.string().c_str(), bip::read_only);
        bip::mapped_region mapped(mapping, bip::read_only);
        fileMapping.swap(mapping);
        region.swap(mapped);
        segmentSize = region.get_size();
    } catch (const bip::interprocess_exception& e) {
        if (e.get_error_code() == bip::not_found_error) {
            throw AccessError(ErrorKind::NotFound, "File no longer exists: " + path.string());
        }
        throw AccessError(ErrorKind::IOError, std::string("Error reading file: ") + e.what());
    }
}

size_t MemorySegment::size() const {
    return segmentSize;
}

const char* MemorySegment::data() const {
    return static_cast<const char*>(region.get_address());
}

FileIdentity MemorySegment::identity() const {
    struct stat st;
    if (::fstat(fileMapping.get_mapping_handle().handle, &st) != 0) {
        std::error_code ec(errno, std::generic_category());
        throw AccessError(ErrorKind::IOError, "Cannot stat mapped file: " + ec.message());
    }
    FileIdentity id;
    id.device = st.st_dev;
    id.inode = st.st_ino;
    return id;
}
