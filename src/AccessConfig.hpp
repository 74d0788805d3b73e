#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include "ResolvedPath.hpp"

// Configuration as parsed from config.json / .env / the environment,
// before any directory is checked against the filesystem.
struct ConfigInput {
    std::vector<std::string> allowedDirectories;
    std::uintmax_t maxFileSizeBytes = 10 * 1024 * 1024;
    std::vector<std::string> allowedExtensions = {
        ".txt", ".md", ".py", ".js", ".json", ".yaml", ".yml", ".csv", ".xml", ".html", ".css"};
    // 0 disables the listing deadline
    std::uint64_t listTimeoutMs = 0;
};

struct PolicyConfig {
    // Allow-list entry meaning "files without an extension"
    static constexpr const char* kNoExtension = ".";

    std::uintmax_t maxFileSizeBytes = 10 * 1024 * 1024;
    // Lowercase, leading dot, configured order, no duplicates. Empty = any.
    std::vector<std::string> allowedExtensions;

    bool allowsExtension(const std::string& extension) const;

    // ".TXT" -> ".txt", "md" -> ".md", " " -> ""
    static std::string normalizeExtension(const std::string& extension);
};

struct RejectedDirectory {
    std::string directory;
    std::string reason;
};

enum class ConfigStatus {
    Configured,
    NotConfigured,  // no directory in the configuration
    Invalid         // directories configured, none usable
};

// Immutable snapshot shared by every request for the process lifetime.
class AccessConfig {
public:
    // Resolves every configured directory, relative ones against the
    // current working directory; missing ones and non-directories
    // are dropped, logged to stderr and kept in rejectedDirectories().
    static AccessConfig fromInput(const ConfigInput& input);

    const std::vector<AllowedRoot>& roots() const { return roots_; }
    const PolicyConfig& policy() const { return policy_; }
    const std::vector<std::string>& configuredDirectories() const { return configured_; }
    const std::vector<RejectedDirectory>& rejectedDirectories() const { return rejected_; }
    std::chrono::milliseconds listTimeout() const { return listTimeout_; }

    ConfigStatus status() const;
    // Human readable reason when status() != Configured
    std::string statusMessage() const;

private:
    AccessConfig() = default;

    std::vector<AllowedRoot> roots_;
    PolicyConfig policy_;
    std::vector<std::string> configured_;
    std::vector<RejectedDirectory> rejected_;
    std::chrono::milliseconds listTimeout_{0};
};

const char* configStatusName(ConfigStatus status);
