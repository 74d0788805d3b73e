#include <iostream>
#include <optional>
#include <string>
#include <sstream>
#include <json/json.h>
#include "AccessConfig.hpp"
#include "ConfigLoader.hpp"
#include "LocalFilesController.hpp"

// stdout carries the protocol; every diagnostic goes to stderr.

void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    std::cout << Json::writeString(writer, message) << std::endl;
}

void handleInitialize(const LocalFilesController& controller, const Json::Value& id) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = false;
    result["capabilities"]["resources"]["listChanged"] = false;
    result["serverInfo"]["name"] = "localfiles-mcp";
    result["serverInfo"]["version"] = "1.0.0";
    writeMessage(controller.createResponse(id, result));
}

void handleReadResource(const LocalFilesController& controller, const Json::Value& id, const Json::Value& params) {
    Json::Value result = controller.readResourceFromUri(params);
    if (result.isMember("__error__")) {
        writeMessage(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    writeMessage(controller.createResponse(id, result));
}

void handleCallTool(const LocalFilesController& controller, const Json::Value& id, const Json::Value& params) {
    Json::Value result = controller.callTool(params);
    if (result.isMember("__error__")) {
        writeMessage(controller.createError(id, -32000, result["__error__"].asString()));
        return;
    }
    writeMessage(controller.createResponse(id, result));
}

void processRequest(const LocalFilesController& controller, const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs) || !request.isObject()) {
        std::cerr << "JSON parse error: " << errs << std::endl;
        writeMessage(controller.createError(Json::Value::null, -32700, "Parse error"));
        return;
    }

    std::string method = request["method"].asString();
    Json::Value id = request["id"];
    Json::Value params = request["params"];

    if (method == "initialize") {
        handleInitialize(controller, id);
    } else if (method == "tools/list") {
        writeMessage(controller.createResponse(id, controller.listTools()));
    } else if (method == "tools/call") {
        handleCallTool(controller, id, params);
    } else if (method == "resources/list") {
        writeMessage(controller.createResponse(id, controller.listResources()));
    } else if (method == "resources/read") {
        handleReadResource(controller, id, params);
    } else if (method.compare(0, 14, "notifications/") == 0) {
        // No response needed for notifications
    } else {
        writeMessage(controller.createError(id, -32601, "Method not found: " + method));
    }
}

int main() {
    std::optional<AccessConfig> loaded;
    try {
        loaded.emplace(AccessConfig::fromInput(ConfigLoader::load()));
    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }
    const AccessConfig& config = *loaded;
    if (config.status() != ConfigStatus::Configured) {
        std::cerr << "WARNING: " << config.statusMessage() << std::endl;
        std::cerr << "Example: ALLOWED_DIRECTORIES=/path/to/dir1,/path/to/dir2" << std::endl;
    } else {
        for (const auto& root : config.roots()) {
            std::cerr << "  - Allowed directory: " << root.path().string() << std::endl;
        }
    }

    LocalFilesController controller(config);
    std::string line;
    std::cerr << "MCP stdio server started" << std::endl;

    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        try {
            processRequest(controller, line);
        } catch (const std::exception& e) {
            // e.g. Json::LogicError on a request with the wrong member types
            std::cerr << "Error processing request: " << e.what() << std::endl;
            writeMessage(controller.createError(Json::Value::null, -32603, "Internal error"));
        }
    }

    return 0;
}
