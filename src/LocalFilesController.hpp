#pragma once
#include <json/json.h>
#include <string>
#include "AccessConfig.hpp"
#include "AccessError.hpp"
#include "AccessGuard.hpp"
#include "DirectoryEnumerator.hpp"

class LocalFilesController {
public:
    explicit LocalFilesController(const AccessConfig& config);

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;

    // Resources and tools
    Json::Value listTools() const;
    Json::Value listResources() const;
    Json::Value readResourceFromUri(const Json::Value& params) const;

    // Call tool by name. Returns a Json::Value suitable as the 'result' field
    // of a JSON-RPC response. Access failures come back as a tool result with
    // isError set; "__error__" is only used for protocol errors (unknown tool).
    Json::Value callTool(const Json::Value& params) const;

    // Operations behind the tools. They throw AccessError; callTool turns
    // that into a structured result.
    Json::Value listFiles(const std::string& directoryPath) const;
    Json::Value readFile(const std::string& filePath) const;
    Json::Value getConfig() const;

    static Json::Value toolResult(const Json::Value& payload);
    static Json::Value toolError(ErrorKind kind, const std::string& message);

private:
    const AccessConfig& config_;
    AccessGuard guard_;
    DirectoryEnumerator enumerator_;
};
