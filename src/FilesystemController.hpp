#pragma once
#include <json/json.h>
#include <functional>
#include <memory>
#include <string>
#include "ChangeNotifier.hpp"
#include "DirectoryLister.hpp"
#include "FileReader.hpp"
#include "FileSearch.hpp"
#include "PathSanitizer.hpp"
#include "ServerConfig.hpp"

// MCP surface of the server: tool and resource listings plus dispatch of
// tools/call and resources/read. Transports own the JSON-RPC framing.
class FilesystemController {
public:
    static constexpr const char* kChangesUri = "file-changes://recent";

    explicit FilesystemController(const ServerConfig& config);
    FilesystemController(const ServerConfig& config, std::unique_ptr<ChangeNotifier> notifier);

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message, const std::string& kind) const;

    // Result of 'initialize'.
    Json::Value initializeResult(const std::string& serverName) const;

    // Resources and tools
    Json::Value listTools() const;
    Json::Value listResources() const;
    Json::Value readResourceFromUri(const Json::Value& params) const;

    // Call tool by name. The optional progress callback receives
    // {files_done, files_total, progress} while search_files scans content.
    // Failures come back as a result with '__error__' and '__error_kind__' set.
    Json::Value callTool(const Json::Value& params, std::function<void(const Json::Value&)> progress = nullptr) const;

    bool changesActive() const { return notifier_->active(); }
    ChangeNotifier& changeNotifier() { return *notifier_; }
    const PathSanitizer& sanitizer() const { return sanitizer_; }

private:
    Json::Value readFileTool(const Json::Value& arguments) const;
    Json::Value listDirectoryTool(const Json::Value& arguments) const;
    Json::Value searchFilesTool(const Json::Value& arguments, const std::function<void(const Json::Value&)>& progress) const;
    Json::Value recentChangesTool() const;

    PathSanitizer sanitizer_;
    FileReader reader_;
    DirectoryLister lister_;
    FileSearch search_;
    std::unique_ptr<ChangeNotifier> notifier_;
};
