#include <iostream>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <cstdlib>
#include <unistd.h>
#include <json/json.h>
#include "../src/AccessConfig.hpp"
#include "../src/ConfigLoader.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

int main() {
    try {
        for (const char* key : {"ALLOWED_DIRECTORIES", "MAX_FILE_SIZE", "ALLOWED_EXTENSIONS", "LIST_TIMEOUT_MS"}) {
            ::unsetenv(key);
        }

        fs::path scratch = fs::temp_directory_path() / ("localfiles_config_" + std::to_string(::getpid()));
        fs::remove_all(scratch);
        fs::create_directories(scratch / "one");
        fs::create_directories(scratch / "two");
        scratch = fs::canonical(scratch);
        std::ofstream(scratch / "file.txt") << "not a directory";

        // defaults
        ConfigInput defaults;
        ASSERT_TRUE(defaults.allowedDirectories.empty());
        ASSERT_TRUE(defaults.maxFileSizeBytes == 10 * 1024 * 1024);
        ASSERT_TRUE(defaults.allowedExtensions.size() == 11);
        ASSERT_TRUE(defaults.listTimeoutMs == 0);

        // comma lists
        auto items = ConfigLoader::splitList(" a, b ,,c ,");
        ASSERT_TRUE(items.size() == 3 && items[0] == "a" && items[1] == "b" && items[2] == "c");
        ASSERT_TRUE(ConfigLoader::splitList("").empty());

        // .env: comments, quotes, unknown keys
        fs::path envPath = scratch / ".env";
        {
            std::ofstream env(envPath);
            env << "# local files\n"
                << "ALLOWED_DIRECTORIES=\"" << (scratch / "one").string() << ", " << (scratch / "two").string() << "\"\n"
                << "MAX_FILE_SIZE = 2048\n"
                << "ALLOWED_EXTENSIONS='.txt,MD'\n"
                << "UNRELATED=1\n"
                << "not an assignment\n";
        }
        ConfigInput fromEnvFile;
        ASSERT_TRUE(ConfigLoader::applyEnvFile(envPath.string(), fromEnvFile));
        ASSERT_TRUE(fromEnvFile.allowedDirectories.size() == 2);
        ASSERT_TRUE(fromEnvFile.allowedDirectories[1] == (scratch / "two").string());
        ASSERT_TRUE(fromEnvFile.maxFileSizeBytes == 2048);
        ASSERT_TRUE(fromEnvFile.allowedExtensions.size() == 2 && fromEnvFile.allowedExtensions[1] == "MD");
        ASSERT_TRUE(!ConfigLoader::applyEnvFile((scratch / "missing.env").string(), fromEnvFile));

        // malformed sizes are configuration errors
        bool threw = false;
        try {
            ConfigInput bad;
            ConfigLoader::applySetting("MAX_FILE_SIZE", "10MB", bad);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);
        threw = false;
        try {
            ConfigInput bad;
            ConfigLoader::applySetting("MAX_FILE_SIZE", "0", bad);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // config.json "mcp" section
        Json::Value mcp;
        mcp["allowed_paths"].append((scratch / "one").string());
        mcp["max_file_size"] = 4096;
        mcp["allowed_extensions"].append(".csv");
        mcp["list_timeout_ms"] = 250;
        ConfigInput fromJson;
        ConfigLoader::applyJson(mcp, fromJson);
        ASSERT_TRUE(fromJson.allowedDirectories.size() == 1);
        ASSERT_TRUE(fromJson.maxFileSizeBytes == 4096);
        ASSERT_TRUE(fromJson.allowedExtensions.size() == 1 && fromJson.allowedExtensions[0] == ".csv");
        ASSERT_TRUE(fromJson.listTimeoutMs == 250);
        threw = false;
        try {
            Json::Value badJson;
            badJson["allowed_paths"] = "not-an-array";
            ConfigInput bad;
            ConfigLoader::applyJson(badJson, bad);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        // precedence: config.json < .env < environment
        fs::path jsonPath = scratch / "config.json";
        {
            Json::Value root;
            root["mcp"] = mcp;
            std::ofstream out(jsonPath);
            out << root;
        }
        ::setenv("MAX_FILE_SIZE", "999", 1);
        ConfigInput merged = ConfigLoader::load(jsonPath.string(), envPath.string());
        ::unsetenv("MAX_FILE_SIZE");
        ASSERT_TRUE(merged.allowedDirectories.size() == 2);  // .env over config.json
        ASSERT_TRUE(merged.maxFileSizeBytes == 999);          // environment over .env
        ASSERT_TRUE(merged.listTimeoutMs == 250);             // only set in config.json

        // snapshot: normalization and rejected directories
        ConfigInput input;
        input.allowedDirectories = {(scratch / "one").string(), (scratch / "missing").string(),
                                    (scratch / "file.txt").string(), scratch.string() + "/two/../one"};
        input.allowedExtensions = {"TXT", ".txt", "md", ""};
        AccessConfig config = AccessConfig::fromInput(input);
        ASSERT_TRUE(config.status() == ConfigStatus::Configured);
        ASSERT_TRUE(config.roots().size() == 1);
        ASSERT_TRUE(config.roots()[0].path() == scratch / "one");
        ASSERT_TRUE(config.rejectedDirectories().size() == 3);
        ASSERT_TRUE(config.rejectedDirectories()[0].reason == "Directory does not exist");
        ASSERT_TRUE(config.rejectedDirectories()[1].reason == "Path is not a directory");
        ASSERT_TRUE(config.configuredDirectories().size() == 4);
        ASSERT_TRUE(config.policy().allowedExtensions.size() == 2);
        ASSERT_TRUE(config.policy().allowedExtensions[0] == ".txt");
        ASSERT_TRUE(config.policy().allowsExtension(".MD"));
        ASSERT_TRUE(!config.policy().allowsExtension(""));

        // relative entries are taken from the working directory, spelling kept
        fs::path previousCwd = fs::current_path();
        fs::current_path(scratch);
        ConfigInput relative;
        relative.allowedDirectories = {"one", "./two/", "missing"};
        AccessConfig fromCwd = AccessConfig::fromInput(relative);
        fs::current_path(previousCwd);
        ASSERT_TRUE(fromCwd.roots().size() == 2);
        ASSERT_TRUE(fromCwd.roots()[0].path() == scratch / "one");
        ASSERT_TRUE(fromCwd.roots()[0].configured() == "one");
        ASSERT_TRUE(fromCwd.roots()[1].path() == scratch / "two");
        ASSERT_TRUE(fromCwd.rejectedDirectories().size() == 1);
        ASSERT_TRUE(fromCwd.rejectedDirectories()[0].reason == "Directory does not exist");

        // nothing configured vs nothing usable
        ConfigInput empty;
        ASSERT_TRUE(AccessConfig::fromInput(empty).status() == ConfigStatus::NotConfigured);
        ASSERT_TRUE(!AccessConfig::fromInput(empty).statusMessage().empty());
        ConfigInput allBad;
        allBad.allowedDirectories = {(scratch / "missing").string(), "relative/dir"};
        AccessConfig invalid = AccessConfig::fromInput(allBad);
        ASSERT_TRUE(invalid.status() == ConfigStatus::Invalid);
        ASSERT_TRUE(invalid.rejectedDirectories().size() == 2);
        ASSERT_TRUE(std::string(configStatusName(invalid.status())) == "invalid");

        fs::remove_all(scratch);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All config loader tests passed" << std::endl;
    return 0;
}
