#include <drogon/drogon.h>
#include <json/json.h>
#include <fstream>
#include <iostream>
#include <memory>
#include "AccessConfig.hpp"
#include "ConfigLoader.hpp"
#include "LocalFilesController.hpp"

// Built in main() before the first request; handlers only read it.
std::unique_ptr<const AccessConfig> accessConfig;
std::unique_ptr<LocalFilesController> controller;

// Handle MCP initialize
void handleInitialize(const Json::Value& id, std::function<void(const Json::Value&)> sendResponse) {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = false;
    result["capabilities"]["resources"]["listChanged"] = false;
    result["serverInfo"]["name"] = "localfiles-mcp-http";
    result["serverInfo"]["version"] = "1.0.0";

    sendResponse(controller->createResponse(id, result));
}

// Handle read resource
void handleReadResource(const Json::Value& id, const Json::Value& params, std::function<void(const Json::Value&)> sendResponse) {
    Json::Value result = controller->readResourceFromUri(params);
    if (result.isMember("__error__")) {
        sendResponse(controller->createError(id, -32000, result["__error__"].asString()));
        return;
    }
    sendResponse(controller->createResponse(id, result));
}

// Handle tool calls
void handleCallTool(const Json::Value& id, const Json::Value& params, std::function<void(const Json::Value&)> sendResponse) {
    Json::Value result = controller->callTool(params);
    if (result.isMember("__error__")) {
        sendResponse(controller->createError(id, -32000, result["__error__"].asString()));
        return;
    }
    sendResponse(controller->createResponse(id, result));
}

// Main HTTP handler for MCP JSON-RPC requests
void handleMcpRequest(const drogon::HttpRequestPtr& req,
                     std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto json = req->getJsonObject();
    if (!json || !json->isObject()) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(
            controller->createError(Json::Value::null, -32700, "Parse error"));
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
        callback(resp);
        return;
    }

    std::string method = (*json)["method"].asString();
    Json::Value id = (*json)["id"];
    Json::Value params = (*json)["params"];

    auto sendResponse = [callback](const Json::Value& response) {
        auto resp = drogon::HttpResponse::newHttpJsonResponse(response);
        callback(resp);
    };

    if (method == "initialize") {
        handleInitialize(id, sendResponse);
    } else if (method == "tools/list") {
        sendResponse(controller->createResponse(id, controller->listTools()));
    } else if (method == "tools/call") {
        handleCallTool(id, params, sendResponse);
    } else if (method == "resources/list") {
        sendResponse(controller->createResponse(id, controller->listResources()));
    } else if (method == "resources/read") {
        handleReadResource(id, params, sendResponse);
    } else if (method.compare(0, 14, "notifications/") == 0) {
        // No response for notifications
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k204NoContent);
        callback(resp);
    } else {
        sendResponse(controller->createError(id, -32601, "Method not found: " + method));
    }
}

int main() {
    using namespace drogon;

    // drogon settings (listeners, threads) and the "mcp" section share config.json
    Json::Value fileConfig;
    std::ifstream configFile("config.json");
    if (configFile) {
        Json::CharReaderBuilder builder;
        std::string errs;
        if (Json::parseFromStream(builder, configFile, &fileConfig, &errs)) {
            app().loadConfigFile("config.json");
        } else {
            std::cout << "Failed to parse config.json: " << errs << std::endl;
        }
    }

    try {
        accessConfig = std::make_unique<const AccessConfig>(AccessConfig::fromInput(ConfigLoader::load()));
    } catch (const std::exception& e) {
        std::cout << "Error loading configuration: " << e.what() << std::endl;
        return 1;
    }
    if (accessConfig->status() != ConfigStatus::Configured) {
        std::cout << "WARNING: " << accessConfig->statusMessage() << std::endl;
    } else {
        for (const auto& root : accessConfig->roots()) {
            std::cout << "  - Allowed directory: " << root.path().string() << std::endl;
        }
        std::cout << "Configured " << accessConfig->roots().size() << " allowed directory(ies)" << std::endl;
    }
    controller = std::make_unique<LocalFilesController>(*accessConfig);

    // HTTP JSON-RPC endpoint
    app().registerHandler("/mcp",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            try {
                handleMcpRequest(req, std::move(callback));
            } catch (const std::exception& e) {
                std::cerr << "Error processing request: " << e.what() << std::endl;
                auto resp = HttpResponse::newHttpJsonResponse(
                    controller->createError(Json::Value::null, -32603, "Internal error"));
                resp->setStatusCode(k500InternalServerError);
                callback(resp);
            }
        },
        {Post});

    // CORS support
    app().registerPreHandlingAdvice(
        [](const HttpRequestPtr& req, AdviceCallback&& acb, AdviceChainCallback&& accb) {
            if (req->method() == Options) {
                auto resp = HttpResponse::newHttpResponse();
                resp->addHeader("Access-Control-Allow-Origin", "*");
                resp->addHeader("Access-Control-Allow-Methods", "POST, OPTIONS");
                resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
                acb(resp);
                return;
            }
            accb();
        });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    // Get configured port, default listener when config.json has none
    int port = 8080;
    const Json::Value& listeners = fileConfig["listeners"];
    if (listeners.isArray() && !listeners.empty()) {
        port = listeners[0].get("port", port).asInt();
    } else {
        app().addListener("0.0.0.0", port);
    }

    std::cout << "MCP HTTP server starting on port " << port << std::endl;
    std::cout << "  HTTP endpoint: http://localhost:" << port << "/mcp" << std::endl;
    app().run();

    return 0;
}
