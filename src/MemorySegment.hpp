#pragma once
#include <cstddef>
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include "FileMetadata.hpp"
#include "ResolvedPath.hpp"

// Read-only mapping of a whole file. An empty file is not mapped and
// reports size() == 0. Mapping failures throw AccessError (NotFound when
// the file vanished, IOError otherwise).
class MemorySegment {
public:
    explicit MemorySegment(const ResolvedPath& path);

    MemorySegment(const MemorySegment&) = delete;
    MemorySegment& operator=(const MemorySegment&) = delete;

    size_t size() const;
    const char* data() const;

    // Device and inode of the mapped file, from the open handle. Only
    // meaningful when size() > 0.
    FileIdentity identity() const;

private:
    boost::interprocess::file_mapping fileMapping;
    boost::interprocess::mapped_region region;
    size_t segmentSize;
};
