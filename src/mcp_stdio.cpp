#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include "FilesystemController.hpp"
#include "ServerConfig.hpp"

namespace {

std::unique_ptr<FilesystemController> controller;

void writeMessage(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    std::cout << Json::writeString(writer, message) << std::endl;
}

void handleInitialize(const Json::Value& id) {
    writeMessage(controller->createResponse(id, controller->initializeResult("mcp-filesystem")));
}

void handleListResources(const Json::Value& id) {
    writeMessage(controller->createResponse(id, controller->listResources()));
}

void handleReadResource(const Json::Value& id, const Json::Value& params) {
    Json::Value result = controller->readResourceFromUri(params);
    if (result.isMember("__error__")) {
        writeMessage(controller->createError(id, -32000, result["__error__"].asString(),
                                             result["__error_kind__"].asString()));
        return;
    }
    writeMessage(controller->createResponse(id, result));
}

void handleListTools(const Json::Value& id) {
    writeMessage(controller->createResponse(id, controller->listTools()));
}

void handleCallTool(const Json::Value& id, const Json::Value& params) {
    // stdio doesn't emit progress updates
    Json::Value result = controller->callTool(params);
    if (result.isMember("__error__")) {
        writeMessage(controller->createError(id, -32000, result["__error__"].asString(),
                                             result["__error_kind__"].asString()));
        return;
    }
    writeMessage(controller->createResponse(id, result));
}

void processRequest(const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs) || !request.isObject()) {
        spdlog::error("JSON parse error: {}", errs);
        writeMessage(controller->createError(Json::Value::null, -32700, "Parse error"));
        return;
    }

    Json::Value id = request["id"];
    if (!request["method"].isString()) {
        writeMessage(controller->createError(id, -32600, "Invalid Request"));
        return;
    }
    std::string method = request["method"].asString();
    Json::Value params = request["params"];

    if (method == "initialize") {
        handleInitialize(id);
    } else if (method == "tools/list") {
        handleListTools(id);
    } else if (method == "tools/call") {
        handleCallTool(id, params);
    } else if (method == "resources/list") {
        handleListResources(id);
    } else if (method == "resources/read") {
        handleReadResource(id, params);
    } else if (method.rfind("notifications/", 0) == 0) {
        // No response needed for notifications
    } else {
        writeMessage(controller->createError(id, -32601, "Method not found: " + method));
    }
}

}  // namespace

int main() {
    ServerConfig config;
    try {
        config = loadServerConfig();
        configureLogging(config, true);
        controller = std::make_unique<FilesystemController>(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to start mcp-filesystem: " << e.what() << std::endl;
        return 1;
    }

    spdlog::info("MCP stdio server started");
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!line.empty()) {
            processRequest(line);
        }
    }

    controller->changeNotifier().stop();
    return 0;
}
