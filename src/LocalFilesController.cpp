#include "LocalFilesController.hpp"
#include "FileReader.hpp"
#include <filesystem>

namespace {

Json::Value metadataToJson(const FileMetadata& meta) {
    Json::Value file;
    file["name"] = meta.name;
    file["path"] = meta.path;
    file["relative_path"] = meta.relativePath;
    file["size"] = static_cast<Json::UInt64>(meta.size);
    file["modified"] = meta.modified;
    file["extension"] = meta.extension;
    file["readable"] = meta.readable();
    if (meta.restriction) {
        file["restriction"] = errorKindName(*meta.restriction);
    }
    return file;
}

Json::Value listingToJson(const DirectoryListing& listing) {
    Json::Value dir;
    dir["directory"] = listing.directory;
    if (listing.errorKind) {
        dir["error"] = listing.error;
        dir["error_kind"] = errorKindName(*listing.errorKind);
        return dir;
    }
    dir["files"] = Json::Value(Json::arrayValue);
    for (const auto& f : listing.files) {
        dir["files"].append(metadataToJson(f));
    }
    dir["subdirectories"] = Json::Value(Json::arrayValue);
    for (const auto& s : listing.subdirectories) {
        Json::Value sub;
        sub["name"] = s.name;
        sub["path"] = s.path;
        sub["relative_path"] = s.relativePath;
        dir["subdirectories"].append(sub);
    }
    dir["total_files"] = static_cast<Json::UInt64>(listing.files.size());
    if (listing.truncated) {
        dir["truncated"] = true;
    }
    return dir;
}

Json::Value stringList(const std::vector<std::string>& items) {
    Json::Value list(Json::arrayValue);
    for (const auto& item : items) {
        list.append(item);
    }
    return list;
}

std::string optionalString(const Json::Value& arguments, const char* key) {
    const Json::Value& v = arguments[key];
    if (v.isNull()) {
        return "";
    }
    if (!v.isString()) {
        throw AccessError(ErrorKind::InvalidPath, std::string(key) + " must be a string");
    }
    return v.asString();
}

Json::Value pathSchema(const char* description) {
    Json::Value prop;
    prop["type"] = "string";
    prop["description"] = description;
    return prop;
}

}  // namespace

LocalFilesController::LocalFilesController(const AccessConfig& config)
    : config_(config), guard_(config), enumerator_(config) {
}

Json::Value LocalFilesController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value LocalFilesController::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value LocalFilesController::listTools() const {
    Json::Value tools(Json::arrayValue);

    Json::Value listTool;
    listTool["name"] = "lf_list_files";
    listTool["description"] = "List the files of one directory level. Without directory_path, lists every allowed directory.";
    listTool["inputSchema"]["type"] = "object";
    listTool["inputSchema"]["properties"]["directory_path"] =
        pathSchema("Absolute path of a directory inside an allowed directory (optional)");
    tools.append(listTool);

    Json::Value readTool;
    readTool["name"] = "lf_read_file";
    readTool["description"] = "Read a file inside an allowed directory. Text is returned as-is, binary content as base64.";
    readTool["inputSchema"]["type"] = "object";
    readTool["inputSchema"]["properties"]["file_path"] = pathSchema("Absolute path of the file to read");
    readTool["inputSchema"]["required"].append("file_path");
    tools.append(readTool);

    Json::Value configTool;
    configTool["name"] = "lf_get_config";
    configTool["description"] = "Show the allowed directories, size limit and allowed extensions in effect.";
    configTool["inputSchema"]["type"] = "object";
    configTool["inputSchema"]["properties"] = Json::objectValue;
    tools.append(configTool);

    Json::Value result;
    result["tools"] = tools;
    return result;
}

Json::Value LocalFilesController::listResources() const {
    Json::Value resources(Json::arrayValue);
    for (const auto& root : config_.roots()) {
        Json::Value resource;
        resource["uri"] = "file://" + root.path().string();
        std::string name = root.path().filename().string();
        resource["name"] = name.empty() ? root.path().string() : name;
        resource["description"] = "Allowed directory (configured as " + root.configured() + ")";
        resource["mimeType"] = "inode/directory";
        resources.append(resource);
    }
    Json::Value result;
    result["resources"] = resources;
    return result;
}

Json::Value LocalFilesController::readResourceFromUri(const Json::Value& params) const {
    Json::Value result;
    std::string uri = params["uri"].asString();
    const std::string scheme = "file://";
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        result["__error__"] = "Unsupported resource URI: " + uri;
        return result;
    }
    try {
        FileContent file = FileReader::read(guard_.guard(uri.substr(scheme.size())), config_.policy());
        result["contents"][0]["uri"] = uri;
        if (file.type == ContentType::Text) {
            result["contents"][0]["mimeType"] = "text/plain";
            result["contents"][0]["text"] = file.content;
        } else {
            result["contents"][0]["mimeType"] = "application/octet-stream";
            result["contents"][0]["blob"] = file.content;
        }
    } catch (const AccessError& e) {
        result = Json::Value();
        result["__error__"] = std::string(errorKindName(e.kind())) + ": " + e.what();
    } catch (const std::exception& e) {
        result = Json::Value();
        result["__error__"] = std::string("Error: ") + e.what();
    }
    return result;
}

Json::Value LocalFilesController::listFiles(const std::string& directoryPath) const {
    std::vector<DirectoryListing> listings;
    if (directoryPath.empty()) {
        listings = enumerator_.enumerate(nullptr);
    } else {
        GuardedPath target = guard_.guard(directoryPath);
        listings = enumerator_.enumerate(&target);
    }

    Json::Value payload;
    payload["allowed_directories"] = stringList(config_.configuredDirectories());
    payload["directories"] = Json::Value(Json::arrayValue);
    for (const auto& listing : listings) {
        payload["directories"].append(listingToJson(listing));
    }
    payload["total_directories"] = static_cast<Json::UInt64>(listings.size());
    return payload;
}

Json::Value LocalFilesController::readFile(const std::string& filePath) const {
    FileContent file = FileReader::read(guard_.guard(filePath), config_.policy());

    Json::Value payload;
    // echo the path as asked for; resolved_path is where it led
    payload["file_path"] = filePath;
    payload["resolved_path"] = file.metadata.path;
    payload["name"] = std::filesystem::path(filePath).filename().string();
    payload["size"] = static_cast<Json::UInt64>(file.metadata.size);
    payload["modified"] = file.metadata.modified;
    payload["extension"] = file.metadata.extension;
    payload["content_type"] = contentTypeName(file.type);
    payload["encoding"] = file.encoding();
    payload["content"] = file.content;
    return payload;
}

Json::Value LocalFilesController::getConfig() const {
    Json::Value payload;
    payload["allowed_directories"] = stringList(config_.configuredDirectories());
    payload["resolved_directories"] = Json::Value(Json::arrayValue);
    for (const auto& root : config_.roots()) {
        payload["resolved_directories"].append(root.path().string());
    }
    payload["rejected_directories"] = Json::Value(Json::arrayValue);
    for (const auto& rejected : config_.rejectedDirectories()) {
        Json::Value entry;
        entry["directory"] = rejected.directory;
        entry["reason"] = rejected.reason;
        payload["rejected_directories"].append(entry);
    }
    payload["max_file_size"] = static_cast<Json::UInt64>(config_.policy().maxFileSizeBytes);
    payload["allowed_extensions"] = stringList(config_.policy().allowedExtensions);
    payload["list_timeout_ms"] = static_cast<Json::UInt64>(config_.listTimeout().count());
    payload["status"] = configStatusName(config_.status());
    if (config_.status() != ConfigStatus::Configured) {
        payload["message"] = config_.statusMessage();
    }
    return payload;
}

Json::Value LocalFilesController::toolResult(const Json::Value& payload) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    Json::Value result;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = Json::writeString(writer, payload);
    result["structuredContent"] = payload;
    result["isError"] = false;
    return result;
}

Json::Value LocalFilesController::toolError(ErrorKind kind, const std::string& message) {
    Json::Value payload;
    payload["error_kind"] = errorKindName(kind);
    payload["message"] = message;
    Json::Value result = toolResult(payload);
    result["isError"] = true;
    return result;
}

Json::Value LocalFilesController::callTool(const Json::Value& params) const {
    Json::Value result;
    std::string toolName = params["name"].asString();
    const Json::Value& arguments = params["arguments"];
    try {
        if (toolName == "lf_list_files") {
            return toolResult(listFiles(optionalString(arguments, "directory_path")));
        } else if (toolName == "lf_read_file") {
            return toolResult(readFile(optionalString(arguments, "file_path")));
        } else if (toolName == "lf_get_config") {
            return toolResult(getConfig());
        }
        result["__error__"] = std::string("Unknown tool: ") + toolName;
        return result;
    } catch (const AccessError& e) {
        return toolError(e.kind(), e.what());
    } catch (const std::exception& e) {
        return toolError(ErrorKind::IOError, std::string("Error: ") + e.what());
    }
}
