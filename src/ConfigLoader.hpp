#pragma once
#include <json/json.h>
#include <string>
#include "AccessConfig.hpp"

// Builds a ConfigInput from, in increasing precedence: built-in defaults,
// the "mcp" section of config.json, a .env file and the process environment.
// Malformed values throw std::runtime_error; missing files are not an error.
class ConfigLoader {
public:
    static ConfigInput load(const std::string& jsonPath = "config.json", const std::string& envPath = ".env");

    // Returns false when the file is missing or not valid JSON
    static bool applyJsonFile(const std::string& path, ConfigInput& input);
    static void applyJson(const Json::Value& mcpSection, ConfigInput& input);

    // Returns false when the file is missing
    static bool applyEnvFile(const std::string& path, ConfigInput& input);
    static void applyEnvironment(ConfigInput& input);

    // One KEY=VALUE assignment from .env or the environment; unknown keys are ignored
    static void applySetting(const std::string& key, const std::string& value, ConfigInput& input);

    static std::vector<std::string> splitList(const std::string& value);
};
