#include "AccessConfig.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include "AccessError.hpp"
#include "PathResolver.hpp"

std::string PolicyConfig::normalizeExtension(const std::string& extension) {
    auto begin = extension.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = extension.find_last_not_of(" \t");
    std::string ext = extension.substr(begin, end - begin + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext.front() != '.') {
        ext.insert(ext.begin(), '.');
    }
    return ext;
}

bool PolicyConfig::allowsExtension(const std::string& extension) const {
    if (allowedExtensions.empty()) {
        return true;
    }
    std::string key = extension.empty() ? std::string(kNoExtension) : normalizeExtension(extension);
    return std::find(allowedExtensions.begin(), allowedExtensions.end(), key) != allowedExtensions.end();
}

AccessConfig AccessConfig::fromInput(const ConfigInput& input) {
    if (input.maxFileSizeBytes == 0) {
        throw std::invalid_argument("max file size must be positive");
    }

    AccessConfig config;
    config.configured_ = input.allowedDirectories;
    config.policy_.maxFileSizeBytes = input.maxFileSizeBytes;
    config.listTimeout_ = std::chrono::milliseconds(input.listTimeoutMs);

    for (const auto& ext : input.allowedExtensions) {
        std::string normalized = PolicyConfig::normalizeExtension(ext);
        if (normalized.empty()) continue;
        auto& list = config.policy_.allowedExtensions;
        if (std::find(list.begin(), list.end(), normalized) == list.end()) {
            list.push_back(normalized);
        }
    }

    for (const auto& dir : input.allowedDirectories) {
        std::string reason;
        try {
            // relative entries are taken from the working directory at startup
            std::string absolute = dir;
            std::filesystem::path configured(dir);
            if (!dir.empty() && configured.is_relative()) {
                std::error_code cwdError;
                std::filesystem::path cwd = std::filesystem::current_path(cwdError);
                if (cwdError) {
                    throw AccessError(ErrorKind::IOError, "Cannot read the working directory: " + cwdError.message());
                }
                absolute = (cwd / configured).string();
            }
            ResolvedPath resolved = PathResolver::resolve(absolute);
            std::error_code ec;
            if (!std::filesystem::is_directory(resolved.path(), ec)) {
                reason = "Path is not a directory";
            } else {
                auto dup = std::find_if(config.roots_.begin(), config.roots_.end(),
                                        [&](const AllowedRoot& r) { return r.resolved() == resolved; });
                if (dup != config.roots_.end()) {
                    reason = "Duplicate of " + dup->configured();
                } else {
                    config.roots_.emplace_back(resolved, dir);
                }
            }
        } catch (const AccessError& e) {
            reason = e.kind() == ErrorKind::NotFound ? "Directory does not exist" : e.what();
        }
        if (!reason.empty()) {
            std::cerr << "Ignoring allowed directory '" << dir << "': " << reason << std::endl;
            config.rejected_.push_back({dir, reason});
        }
    }
    return config;
}

ConfigStatus AccessConfig::status() const {
    if (configured_.empty()) {
        return ConfigStatus::NotConfigured;
    }
    if (roots_.empty()) {
        return ConfigStatus::Invalid;
    }
    return ConfigStatus::Configured;
}

std::string AccessConfig::statusMessage() const {
    switch (status()) {
        case ConfigStatus::NotConfigured:
            return "No allowed directories configured. Please set ALLOWED_DIRECTORIES in .env file.";
        case ConfigStatus::Invalid:
            return "None of the configured allowed directories exists or is a directory.";
        case ConfigStatus::Configured:
            break;
    }
    return "";
}

const char* configStatusName(ConfigStatus status) {
    switch (status) {
        case ConfigStatus::Configured: return "configured";
        case ConfigStatus::NotConfigured: return "not_configured";
        case ConfigStatus::Invalid: return "invalid";
    }
    return "invalid";
}
