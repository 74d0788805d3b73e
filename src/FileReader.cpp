#include "FileReader.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include "MemorySegment.hpp"
#include "PathResolver.hpp"

std::string FileReader::encodeBase64(const char* data, std::size_t size) {
    using namespace boost::archive::iterators;
    using Base64Iterator = base64_from_binary<transform_width<const char*, 6, 8>>;
    if (size == 0) {
        return "";
    }
    std::string encoded(Base64Iterator(data), Base64Iterator(data + size));
    encoded.append((3 - size % 3) % 3, '=');
    return encoded;
}

// The mapping was opened by path. A component swapped for a symlink after
// the guard resolved it would have sent it somewhere else, so the path must
// still resolve to itself and name the file that is mapped.
void FileReader::verifyMapped(const GuardedPath& file, const MemorySegment& segment) {
    ResolvedPath current = PathResolver::refresh(file.resolved());
    if (current != file.resolved()) {
        throw AccessError::accessDenied();
    }
    if (segment.size() > 0 && segment.identity() != FileStat::of(current).identity) {
        throw AccessError::accessDenied();
    }
}

FileContent FileReader::read(const GuardedPath& file, const PolicyConfig& policy) {
    FileStat st = FileStat::of(file.resolved());
    if (!std::filesystem::is_regular_file(st.status)) {
        throw AccessError(ErrorKind::InvalidPath, "Path is not a file.");
    }
    PolicyFilter::enforce(file.resolved(), st.status, st.size, policy);

    MemorySegment segment(file.resolved());
    verifyMapped(file, segment);
    // the file may have grown between stat and map
    PolicyFilter::enforce(file.resolved(), st.status, segment.size(), policy);

    FileContent result;
    result.metadata = FileMetadata::describe(file.path(), file.resolved(), file.root(), policy);
    result.metadata.size = segment.size();
    result.type = PolicyFilter::classify(segment.data(), segment.size());
    if (result.type == ContentType::Text) {
        if (segment.size() > 0) result.content.assign(segment.data(), segment.size());
    } else {
        result.content = encodeBase64(segment.data(), segment.size());
    }
    return result;
}
