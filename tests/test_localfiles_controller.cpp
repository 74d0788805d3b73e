#include <iostream>
#include <fstream>
#include <filesystem>
#include <sstream>
#include <string>
#include <unistd.h>
#include <json/json.h>
#include "../src/LocalFilesController.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

static Json::Value call(const LocalFilesController& controller, const std::string& tool, const std::string& key = "", const std::string& value = "") {
    Json::Value params;
    params["name"] = tool;
    params["arguments"] = Json::objectValue;
    if (!key.empty()) {
        params["arguments"][key] = value;
    }
    return controller.callTool(params);
}

static std::string errorKindOf(const Json::Value& result) {
    if (!result["isError"].asBool()) return "";
    return result["structuredContent"]["error_kind"].asString();
}

int main() {
    try {
        fs::path scratch = fs::temp_directory_path() / ("localfiles_controller_" + std::to_string(::getpid()));
        fs::remove_all(scratch);
        fs::create_directories(scratch / "data");
        fs::create_directories(scratch / "data2");
        fs::create_directories(scratch / "etc");
        scratch = fs::canonical(scratch);
        fs::path data = scratch / "data";

        std::string notes;
        for (int i = 0; notes.size() < 500; ++i) notes += "line " + std::to_string(i) + "\n";
        notes.resize(500);
        std::ofstream(data / "notes.txt", std::ios::binary) << notes;
        std::ofstream(data / "big.bin") << std::string(5000, 'b');
        std::ofstream(scratch / "etc" / "passwd") << "root:x:0:0";
        std::ofstream(scratch / "data2" / "sibling.txt") << "sibling";
        fs::create_symlink(scratch / "etc", data / "etc_link");

        ConfigInput input;
        input.allowedDirectories = {data.string()};
        input.maxFileSizeBytes = 1000;
        input.allowedExtensions = {".txt", ".bin"};
        AccessConfig config = AccessConfig::fromInput(input);
        LocalFilesController controller(config);

        // tools
        Json::Value tools = controller.listTools();
        ASSERT_TRUE(tools["tools"].size() == 3);
        ASSERT_TRUE(tools["tools"][1]["name"].asString() == "lf_read_file");

        // read: exact text
        Json::Value read = call(controller, "lf_read_file", "file_path", (data / "notes.txt").string());
        ASSERT_TRUE(!read.isMember("__error__"));
        ASSERT_TRUE(!read["isError"].asBool());
        const Json::Value& file = read["structuredContent"];
        ASSERT_TRUE(file["size"].asUInt64() == 500);
        ASSERT_TRUE(file["extension"].asString() == ".txt");
        ASSERT_TRUE(file["content_type"].asString() == "text");
        ASSERT_TRUE(file["content"].asString() == notes);
        ASSERT_TRUE(file["name"].asString() == "notes.txt");
        // content[0].text carries the same payload as JSON
        Json::Value parsed;
        std::string errs;
        std::istringstream iss(read["content"][0]["text"].asString());
        ASSERT_TRUE(Json::parseFromStream(Json::CharReaderBuilder(), iss, &parsed, &errs));
        ASSERT_TRUE(parsed["file_path"] == file["file_path"]);
        ASSERT_TRUE(parsed["size"].asUInt64() == 500);
        ASSERT_TRUE(parsed["content_type"] == file["content_type"]);
        ASSERT_TRUE(parsed["content"] == file["content"]);

        // the requested spelling is echoed back, the canonical one alongside
        std::string indirect = data.string() + "/../data/./notes.txt";
        Json::Value viaDots = call(controller, "lf_read_file", "file_path", indirect);
        ASSERT_TRUE(!viaDots["isError"].asBool());
        ASSERT_TRUE(viaDots["structuredContent"]["file_path"].asString() == indirect);
        ASSERT_TRUE(viaDots["structuredContent"]["resolved_path"].asString() == (data / "notes.txt").string());
        ASSERT_TRUE(viaDots["structuredContent"]["name"].asString() == "notes.txt");

        // too large to read, still listed
        Json::Value big = call(controller, "lf_read_file", "file_path", (data / "big.bin").string());
        ASSERT_TRUE(errorKindOf(big) == "FileTooLarge");
        Json::Value list = call(controller, "lf_list_files");
        ASSERT_TRUE(!list["isError"].asBool());
        const Json::Value& listing = list["structuredContent"];
        ASSERT_TRUE(listing["total_directories"].asUInt64() == 1);
        ASSERT_TRUE(listing["allowed_directories"][0].asString() == data.string());
        bool foundBig = false;
        for (const auto& f : listing["directories"][0]["files"]) {
            if (f["name"].asString() == "big.bin") {
                foundBig = f["size"].asUInt64() == 5000 && !f["readable"].asBool() &&
                           f["restriction"].asString() == "FileTooLarge";
            }
        }
        ASSERT_TRUE(foundBig);
        ASSERT_TRUE(listing["directories"][0]["total_files"].asUInt64() == 2);

        // listing is repeatable
        ASSERT_TRUE(call(controller, "lf_list_files")["structuredContent"] == listing);

        // escapes are NotAllowed
        Json::Value passwd = call(controller, "lf_read_file", "file_path", data.string() + "/../etc/passwd");
        ASSERT_TRUE(errorKindOf(passwd) == "NotAllowed");
        ASSERT_TRUE(errorKindOf(call(controller, "lf_read_file", "file_path", (data / "etc_link" / "passwd").string())) == "NotAllowed");
        ASSERT_TRUE(errorKindOf(call(controller, "lf_read_file", "file_path", (scratch / "data2" / "sibling.txt").string())) == "NotAllowed");
        ASSERT_TRUE(errorKindOf(call(controller, "lf_list_files", "directory_path", (scratch / "data2").string())) == "NotAllowed");
        // a missing path outside the roots does not reveal that it is missing
        Json::Value hidden = call(controller, "lf_read_file", "file_path", (scratch / "etc" / "shadow").string());
        ASSERT_TRUE(errorKindOf(hidden) == "NotAllowed");
        ASSERT_TRUE(hidden["structuredContent"]["message"] == passwd["structuredContent"]["message"]);
        // a missing path inside does
        ASSERT_TRUE(errorKindOf(call(controller, "lf_read_file", "file_path", (data / "missing.txt").string())) == "NotFound");
        ASSERT_TRUE(errorKindOf(call(controller, "lf_read_file", "file_path", "notes.txt")) == "InvalidPath");
        ASSERT_TRUE(errorKindOf(call(controller, "lf_read_file")) == "InvalidPath");
        ASSERT_TRUE(errorKindOf(call(controller, "lf_list_files", "directory_path", (data / "notes.txt").string())) == "InvalidPath");

        // protocol errors
        Json::Value unknown = call(controller, "no_such_tool");
        ASSERT_TRUE(unknown.isMember("__error__"));
        Json::Value wrongType;
        wrongType["name"] = "lf_read_file";
        wrongType["arguments"]["file_path"] = 42;
        ASSERT_TRUE(errorKindOf(controller.callTool(wrongType)) == "InvalidPath");

        // resources
        Json::Value resources = controller.listResources();
        ASSERT_TRUE(resources["resources"].size() == 1);
        ASSERT_TRUE(resources["resources"][0]["uri"].asString() == "file://" + data.string());
        Json::Value uriParams;
        uriParams["uri"] = "file://" + (data / "notes.txt").string();
        Json::Value resource = controller.readResourceFromUri(uriParams);
        ASSERT_TRUE(!resource.isMember("__error__"));
        ASSERT_TRUE(resource["contents"][0]["text"].asString() == notes);
        uriParams["uri"] = "file://" + (scratch / "etc" / "passwd").string();
        ASSERT_TRUE(controller.readResourceFromUri(uriParams).isMember("__error__"));

        // configuration
        Json::Value cfg = call(controller, "lf_get_config")["structuredContent"];
        ASSERT_TRUE(cfg["status"].asString() == "configured");
        ASSERT_TRUE(cfg["max_file_size"].asUInt64() == 1000);
        ASSERT_TRUE(cfg["allowed_extensions"].size() == 2);
        ASSERT_TRUE(cfg["resolved_directories"][0].asString() == data.string());

        // nothing configured: explicit, not an empty success
        AccessConfig empty = AccessConfig::fromInput(ConfigInput());
        LocalFilesController bare(empty);
        Json::Value bareConfig = call(bare, "lf_get_config")["structuredContent"];
        ASSERT_TRUE(bareConfig["status"].asString() == "not_configured");
        ASSERT_TRUE(bareConfig.isMember("message"));
        ASSERT_TRUE(errorKindOf(call(bare, "lf_list_files")) == "NotConfigured");
        ASSERT_TRUE(errorKindOf(call(bare, "lf_read_file", "file_path", (data / "notes.txt").string())) == "NotConfigured");

        // configured but none usable
        ConfigInput broken;
        broken.allowedDirectories = {(scratch / "nowhere").string()};
        AccessConfig invalid = AccessConfig::fromInput(broken);
        LocalFilesController invalidController(invalid);
        Json::Value invalidConfig = call(invalidController, "lf_get_config")["structuredContent"];
        ASSERT_TRUE(invalidConfig["status"].asString() == "invalid");
        ASSERT_TRUE(invalidConfig["rejected_directories"].size() == 1);
        ASSERT_TRUE(errorKindOf(call(invalidController, "lf_list_files")) == "NotConfigured");

        fs::remove_all(scratch);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All LocalFilesController tests passed" << std::endl;
    return 0;
}
