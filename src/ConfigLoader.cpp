#include "ConfigLoader.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

const char* const kSettingKeys[] = {"ALLOWED_DIRECTORIES", "MAX_FILE_SIZE", "ALLOWED_EXTENSIONS", "LIST_TIMEOUT_MS"};

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::uint64_t parseUnsigned(const std::string& key, const std::string& value) {
    std::string v = trim(value);
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
        throw std::runtime_error("Invalid " + key + ": '" + value + "' is not a non-negative integer");
    }
    try {
        return std::stoull(v);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Invalid " + key + ": '" + value + "' is out of range");
    }
}

std::vector<std::string> jsonStringList(const Json::Value& value, const std::string& key) {
    if (!value.isArray()) {
        throw std::runtime_error("config.json: mcp." + key + " must be an array of strings");
    }
    std::vector<std::string> out;
    for (const auto& item : value) {
        if (!item.isString()) {
            throw std::runtime_error("config.json: mcp." + key + " must be an array of strings");
        }
        std::string s = trim(item.asString());
        if (!s.empty()) out.push_back(s);
    }
    return out;
}

}  // namespace

std::vector<std::string> ConfigLoader::splitList(const std::string& value) {
    std::vector<std::string> out;
    std::string::size_type start = 0;
    while (start <= value.size()) {
        auto comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        std::string item = trim(value.substr(start, comma - start));
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

void ConfigLoader::applySetting(const std::string& key, const std::string& value, ConfigInput& input) {
    if (key == "ALLOWED_DIRECTORIES") {
        input.allowedDirectories = splitList(value);
    } else if (key == "MAX_FILE_SIZE") {
        std::uint64_t size = parseUnsigned(key, value);
        if (size == 0) {
            throw std::runtime_error("Invalid MAX_FILE_SIZE: must be positive");
        }
        input.maxFileSizeBytes = size;
    } else if (key == "ALLOWED_EXTENSIONS") {
        input.allowedExtensions = splitList(value);
    } else if (key == "LIST_TIMEOUT_MS") {
        input.listTimeoutMs = parseUnsigned(key, value);
    }
}

void ConfigLoader::applyJson(const Json::Value& mcp, ConfigInput& input) {
    if (!mcp.isObject()) {
        return;
    }
    if (mcp.isMember("allowed_paths")) {
        input.allowedDirectories = jsonStringList(mcp["allowed_paths"], "allowed_paths");
    }
    if (mcp.isMember("max_file_size")) {
        const Json::Value& v = mcp["max_file_size"];
        if (!v.isUInt64() || v.asUInt64() == 0) {
            throw std::runtime_error("config.json: mcp.max_file_size must be a positive integer");
        }
        input.maxFileSizeBytes = v.asUInt64();
    }
    if (mcp.isMember("allowed_extensions")) {
        input.allowedExtensions = jsonStringList(mcp["allowed_extensions"], "allowed_extensions");
    }
    if (mcp.isMember("list_timeout_ms")) {
        const Json::Value& v = mcp["list_timeout_ms"];
        if (!v.isUInt64()) {
            throw std::runtime_error("config.json: mcp.list_timeout_ms must be a non-negative integer");
        }
        input.listTimeoutMs = v.asUInt64();
    }
}

bool ConfigLoader::applyJsonFile(const std::string& path, ConfigInput& input) {
    std::ifstream configFile(path);
    if (!configFile) {
        return false;
    }
    Json::Value config;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &config, &errs)) {
        std::cerr << "Failed to parse " << path << ": " << errs << std::endl;
        return false;
    }
    if (config.isMember("mcp")) {
        applyJson(config["mcp"], input);
    }
    return true;
}

bool ConfigLoader::applyEnvFile(const std::string& path, ConfigInput& input) {
    std::ifstream envFile(path);
    if (!envFile) {
        return false;
    }
    std::string line;
    while (std::getline(envFile, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        // strip surrounding quotes: KEY="a,b" / KEY='a,b'
        auto first = value.find_first_not_of("\"'");
        auto last = value.find_last_not_of("\"'");
        value = first == std::string::npos ? "" : value.substr(first, last - first + 1);
        applySetting(key, value, input);
    }
    return true;
}

void ConfigLoader::applyEnvironment(ConfigInput& input) {
    for (const char* key : kSettingKeys) {
        const char* value = std::getenv(key);
        if (value && *value) {
            applySetting(key, value, input);
        }
    }
}

ConfigInput ConfigLoader::load(const std::string& jsonPath, const std::string& envPath) {
    ConfigInput input;
    applyJsonFile(jsonPath, input);
    applyEnvFile(envPath, input);
    applyEnvironment(input);
    return input;
}
