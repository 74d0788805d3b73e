#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include "AccessConfig.hpp"
#include "AccessError.hpp"
#include "ResolvedPath.hpp"

enum class ContentType { Text, Binary };

const char* contentTypeName(ContentType type);

struct PolicyDecision {
    bool accepted = true;
    ErrorKind reason = ErrorKind::IOError;  // meaningful only when !accepted
    std::string message;

    static PolicyDecision accept() { return PolicyDecision(); }
    static PolicyDecision reject(ErrorKind reason, std::string message) {
        return PolicyDecision{false, reason, std::move(message)};
    }
};

// Size and extension rules for files already proven to be inside a root.
class PolicyFilter {
public:
    // Extension as it appears on disk ("Notes.TXT" -> ".TXT"); empty for
    // "Makefile", ".bashrc" and "name."
    static std::string extensionOf(const std::filesystem::path& path);

    // Directories are never size- or extension-checked.
    static PolicyDecision check(const ResolvedPath& path, const std::filesystem::file_status& status,
                                std::uintmax_t size, const PolicyConfig& config);

    // check() for the read gate: throws FileTooLarge / ExtensionNotAllowed
    static void enforce(const ResolvedPath& path, const std::filesystem::file_status& status,
                        std::uintmax_t size, const PolicyConfig& config);

    // Text when the whole buffer is valid UTF-8, Binary otherwise
    static ContentType classify(const char* data, std::size_t size);
};
