#pragma once
#include <cstddef>
#include <string>
#include "AccessConfig.hpp"
#include "AccessGuard.hpp"
#include "FileMetadata.hpp"
#include "MemorySegment.hpp"
#include "PolicyFilter.hpp"

struct FileContent {
    FileMetadata metadata;
    ContentType type = ContentType::Text;
    // Exact bytes for Text, base64 for Binary
    std::string content;

    const char* encoding() const { return type == ContentType::Text ? "utf-8" : "base64"; }
};

class FileReader {
public:
    // Throws AccessError: InvalidPath for anything but a regular file,
    // FileTooLarge, ExtensionNotAllowed, NotAllowed if the path no longer
    // leads to the file that was guarded, NotFound if the file vanished,
    // IOError on other read failures.
    static FileContent read(const GuardedPath& file, const PolicyConfig& policy);

    static std::string encodeBase64(const char* data, std::size_t size);

private:
    static void verifyMapped(const GuardedPath& file, const MemorySegment& segment);
};
