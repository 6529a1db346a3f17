#include "FilesystemController.hpp"
#include "ToolError.hpp"
#include <spdlog/spdlog.h>

namespace {

std::string compactJson(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

std::string requireString(const Json::Value& arguments, const char* key) {
    const Json::Value& v = arguments[key];
    if (!v.isString()) {
        throw ToolError(ErrorKind::InvalidInput, std::string("Missing or invalid string argument: ") + key);
    }
    return v.asString();
}

std::string optionalString(const Json::Value& arguments, const char* key, const std::string& fallback) {
    const Json::Value& v = arguments[key];
    if (v.isNull()) return fallback;
    if (!v.isString()) {
        throw ToolError(ErrorKind::InvalidInput, std::string("Argument must be a string: ") + key);
    }
    return v.asString();
}

bool optionalBool(const Json::Value& arguments, const char* key, bool fallback) {
    const Json::Value& v = arguments[key];
    if (v.isNull()) return fallback;
    if (!v.isBool()) {
        throw ToolError(ErrorKind::InvalidInput, std::string("Argument must be a boolean: ") + key);
    }
    return v.asBool();
}

Json::Value textResult(const std::string& text) {
    Json::Value result;
    result["content"][0]["type"] = "text";
    result["content"][0]["text"] = text;
    return result;
}

// Structured results travel both as JSON text and as structuredContent.
Json::Value structuredResult(const Json::Value& items) {
    Json::Value result = textResult(compactJson(items));
    result["structuredContent"]["result"] = items;
    return result;
}

Json::Value stringProperty(const std::string& description) {
    Json::Value p;
    p["type"] = "string";
    p["description"] = description;
    return p;
}

Json::Value boolProperty(const std::string& description, bool def) {
    Json::Value p;
    p["type"] = "boolean";
    p["description"] = description;
    p["default"] = def;
    return p;
}

}  // namespace

FilesystemController::FilesystemController(const ServerConfig& config)
    : FilesystemController(config, nullptr) {}

FilesystemController::FilesystemController(const ServerConfig& config, std::unique_ptr<ChangeNotifier> notifier)
    : sanitizer_(config.baseDir),
      reader_(sanitizer_, config.maxReadBytes),
      lister_(sanitizer_),
      search_(sanitizer_, config.maxReadBytes),
      notifier_(std::move(notifier)) {
    spdlog::info("Base directory set to: {}", sanitizer_.base().string());
    if (!notifier_) {
        notifier_ = makeChangeNotifier(sanitizer_, config.watchChanges, config.changeCapacity);
    }
}

Json::Value FilesystemController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value FilesystemController::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value FilesystemController::createError(const Json::Value& id, int code, const std::string& message,
                                              const std::string& kind) const {
    Json::Value response = createError(id, code, message);
    if (!kind.empty()) {
        response["error"]["data"]["kind"] = kind;
    }
    return response;
}

Json::Value FilesystemController::initializeResult(const std::string& serverName) const {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["capabilities"]["resources"]["subscribe"] = false;
    result["capabilities"]["resources"]["listChanged"] = false;
    result["serverInfo"]["name"] = serverName;
    result["serverInfo"]["version"] = "1.0.0";
    return result;
}

Json::Value FilesystemController::listTools() const {
    Json::Value tools(Json::arrayValue);

    Json::Value readFile;
    readFile["name"] = "read_file";
    readFile["description"] = "Read and return the contents of a text file. The path can be absolute or relative to the base directory.";
    readFile["inputSchema"]["type"] = "object";
    readFile["inputSchema"]["properties"]["path"] = stringProperty("The path to the file to read");
    readFile["inputSchema"]["required"].append("path");
    tools.append(readFile);

    Json::Value listDir;
    listDir["name"] = "list_directory";
    listDir["description"] = "List the files and subdirectories of a directory with type, size (files only) and hidden flag, sorted by name.";
    listDir["inputSchema"]["type"] = "object";
    listDir["inputSchema"]["properties"]["path"] = stringProperty("The path to the directory to list");
    listDir["inputSchema"]["properties"]["include_hidden"] = boolProperty("Whether to include hidden entries (starting with '.')", false);
    listDir["inputSchema"]["required"].append("path");
    tools.append(listDir);

    Json::Value searchFiles;
    searchFiles["name"] = "search_files";
    searchFiles["description"] = "Search for files matching a glob pattern and optionally containing lines that match a regular expression.";
    searchFiles["inputSchema"]["type"] = "object";
    searchFiles["inputSchema"]["properties"]["pattern"] = stringProperty("Glob pattern to match file names (e.g. \"*.py\", \"data/*.csv\")");
    Json::Value searchPath = stringProperty("Directory to search in");
    searchPath["default"] = ".";
    searchFiles["inputSchema"]["properties"]["search_path"] = searchPath;
    searchFiles["inputSchema"]["properties"]["recursive"] = boolProperty("Whether to search subdirectories", true);
    searchFiles["inputSchema"]["properties"]["content_regex"] = stringProperty("Optional regular expression searched for in each line of matching files");
    searchFiles["inputSchema"]["required"].append("pattern");
    tools.append(searchFiles);

    if (notifier_->active()) {
        Json::Value changes;
        changes["name"] = "get_recent_changes";
        changes["description"] = "Return the most recent file changes observed under the base directory.";
        changes["inputSchema"]["type"] = "object";
        changes["inputSchema"]["properties"] = Json::objectValue;
        tools.append(changes);
    }

    Json::Value result;
    result["tools"] = tools;
    return result;
}

Json::Value FilesystemController::listResources() const {
    Json::Value resources(Json::arrayValue);
    if (notifier_->active()) {
        Json::Value resource;
        resource["uri"] = kChangesUri;
        resource["name"] = "recent-file-changes";
        resource["description"] = "Most recent file changes under the base directory";
        resource["mimeType"] = "application/json";
        resources.append(resource);
    }
    Json::Value result;
    result["resources"] = resources;
    return result;
}

Json::Value FilesystemController::readResourceFromUri(const Json::Value& params) const {
    Json::Value result;
    std::string uri = params.isObject() && params["uri"].isString() ? params["uri"].asString() : std::string();
    if (uri != kChangesUri) {
        result["__error__"] = "Resource not found: " + uri;
        result["__error_kind__"] = errorKindName(ErrorKind::NotFound);
        return result;
    }
    result["contents"][0]["uri"] = uri;
    result["contents"][0]["mimeType"] = "application/json";
    result["contents"][0]["text"] = compactJson(notifier_->recentChangesJson());
    return result;
}

Json::Value FilesystemController::readFileTool(const Json::Value& arguments) const {
    return textResult(reader_.read(requireString(arguments, "path")));
}

Json::Value FilesystemController::listDirectoryTool(const Json::Value& arguments) const {
    std::string path = requireString(arguments, "path");
    bool includeHidden = optionalBool(arguments, "include_hidden", false);

    Json::Value items(Json::arrayValue);
    for (const auto& entry : lister_.list(path, includeHidden)) {
        Json::Value item;
        item["name"] = entry.name;
        item["type"] = entry.isDirectory ? "directory" : "file";
        if (entry.size) {
            item["size"] = static_cast<Json::UInt64>(*entry.size);
        }
        item["is_hidden"] = entry.hidden;
        items.append(item);
    }
    return structuredResult(items);
}

Json::Value FilesystemController::searchFilesTool(const Json::Value& arguments,
                                                  const std::function<void(const Json::Value&)>& progress) const {
    SearchRequest request;
    request.pattern = requireString(arguments, "pattern");
    request.searchPath = optionalString(arguments, "search_path", ".");
    request.recursive = optionalBool(arguments, "recursive", true);
    std::string regex = optionalString(arguments, "content_regex", "");
    if (!regex.empty()) {
        request.contentRegex = regex;
    }

    FileSearch::ProgressCallback onProgress;
    if (progress) {
        onProgress = [&progress](size_t done, size_t total) {
            Json::Value p;
            p["files_done"] = static_cast<Json::UInt64>(done);
            p["files_total"] = static_cast<Json::UInt64>(total);
            p["progress"] = total == 0 ? 1.0 : static_cast<double>(done) / static_cast<double>(total);
            progress(p);
        };
    }

    Json::Value items(Json::arrayValue);
    for (const auto& found : search_.search(request, onProgress)) {
        Json::Value item;
        item["path"] = found.path;
        item["size"] = static_cast<Json::UInt64>(found.size);
        if (found.matches) {
            item["matches"] = Json::Value(Json::arrayValue);
            for (const auto& m : *found.matches) {
                Json::Value match;
                match["line_number"] = static_cast<Json::UInt64>(m.lineNumber);
                match["content"] = m.content;
                item["matches"].append(match);
            }
        }
        items.append(item);
    }
    return structuredResult(items);
}

Json::Value FilesystemController::recentChangesTool() const {
    return structuredResult(notifier_->recentChangesJson());
}

Json::Value FilesystemController::callTool(const Json::Value& params,
                                           std::function<void(const Json::Value&)> progress) const {
    Json::Value result;
    std::string toolName;
    try {
        if (!params.isObject()) {
            throw ToolError(ErrorKind::InvalidInput, "tools/call params must be an object");
        }
        toolName = params["name"].asString();
        const Json::Value& arguments = params["arguments"];
        if (!arguments.isNull() && !arguments.isObject()) {
            throw ToolError(ErrorKind::InvalidInput, "Tool arguments must be an object");
        }
        spdlog::debug("Tool call: {}", toolName);
        if (toolName == "read_file") {
            return readFileTool(arguments);
        } else if (toolName == "list_directory") {
            return listDirectoryTool(arguments);
        } else if (toolName == "search_files") {
            return searchFilesTool(arguments, progress);
        } else if (toolName == "get_recent_changes") {
            return recentChangesTool();
        }
        result["__error__"] = std::string("Unknown tool: ") + toolName;
        result["__error_kind__"] = errorKindName(ErrorKind::InvalidInput);
    } catch (const ToolError& e) {
        spdlog::error("{} failed: {}", toolName, e.what());
        result["__error__"] = e.what();
        result["__error_kind__"] = errorKindName(e.kind());
    } catch (const std::exception& e) {
        spdlog::error("{} failed: {}", toolName, e.what());
        result["__error__"] = std::string("Error: ") + e.what();
        result["__error_kind__"] = errorKindName(ErrorKind::IoFailure);
    }
    return result;
}
