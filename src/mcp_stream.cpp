#include <drogon/drogon.h>
#include <json/json.h>
#include <filesystem>
#include <iostream>
#include <memory>
#include <spdlog/spdlog.h>
#include "FilesystemController.hpp"
#include "SSEBroadcaster.hpp"
#include "ServerConfig.hpp"

namespace {

std::unique_ptr<FilesystemController> controller;
SSEBroadcaster broadcaster;

std::string compact(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

void sendNotification(const std::string& method, const Json::Value& params = Json::Value()) {
    Json::Value notification;
    notification["jsonrpc"] = "2.0";
    notification["method"] = method;
    if (!params.isNull()) {
        notification["params"] = params;
    }
    broadcaster.broadcast("message", compact(notification));
}

// Handle tool calls; search progress is pushed to SSE subscribers
Json::Value handleCallTool(const Json::Value& id, const Json::Value& params) {
    Json::Value token;
    if (params.isObject() && params["_meta"].isObject()) {
        token = params["_meta"]["progressToken"];
    }
    auto progressCb = [&token](const Json::Value& p) {
        if (token.isNull()) return;
        Json::Value progressParams;
        progressParams["progressToken"] = token;
        progressParams["progress"] = p["files_done"];
        progressParams["total"] = p["files_total"];
        sendNotification("notifications/progress", progressParams);
    };
    Json::Value result = controller->callTool(params, progressCb);
    if (result.isMember("__error__")) {
        return controller->createError(id, -32000, result["__error__"].asString(), result["__error_kind__"].asString());
    }
    return controller->createResponse(id, result);
}

Json::Value handleReadResource(const Json::Value& id, const Json::Value& params) {
    Json::Value result = controller->readResourceFromUri(params);
    if (result.isMember("__error__")) {
        return controller->createError(id, -32000, result["__error__"].asString(), result["__error_kind__"].asString());
    }
    return controller->createResponse(id, result);
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

    Json::Value id = (*json)["id"];
    Json::Value params = (*json)["params"];
    if (!(*json)["method"].isString()) {
        callback(drogon::HttpResponse::newHttpJsonResponse(controller->createError(id, -32600, "Invalid Request")));
        return;
    }
    std::string method = (*json)["method"].asString();

    Json::Value response;
    if (method == "initialize") {
        Json::Value result = controller->initializeResult("mcp-filesystem-stream");
        result["capabilities"]["streaming"] = true;
        response = controller->createResponse(id, result);
    } else if (method == "tools/list") {
        response = controller->createResponse(id, controller->listTools());
    } else if (method == "tools/call") {
        response = handleCallTool(id, params);
    } else if (method == "resources/list") {
        response = controller->createResponse(id, controller->listResources());
    } else if (method == "resources/read") {
        response = handleReadResource(id, params);
    } else if (method.rfind("notifications/", 0) == 0) {
        // No response for notifications
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k204NoContent);
        callback(resp);
        return;
    } else {
        response = controller->createError(id, -32601, "Method not found: " + method);
    }
    callback(drogon::HttpResponse::newHttpJsonResponse(response));
}

// SSE endpoint for notifications and progress
void handleSSE(const drogon::HttpRequestPtr&,
               std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto resp = drogon::HttpResponse::newAsyncStreamResponse(
        [](drogon::ResponseStreamPtr stream) {
            std::shared_ptr<drogon::ResponseStream> shared = std::move(stream);
            if (!shared->send(SSEBroadcaster::formatEvent("endpoint", "/mcp"))) {
                return;
            }
            auto subscription = std::make_shared<uint64_t>(0);
            *subscription = broadcaster.subscribe([shared, subscription](const std::string& event) {
                if (!shared->send(event)) {
                    broadcaster.unsubscribe(*subscription);
                }
            });
            spdlog::debug("SSE client connected ({} total)", broadcaster.subscriberCount());
        },
        true);
    resp->setContentTypeString("text/event-stream");
    resp->addHeader("Cache-Control", "no-cache");
    resp->addHeader("X-Accel-Buffering", "no");
    callback(resp);
}

}  // namespace

int main() {
    using namespace drogon;

    const std::string configPath = "config.json";
    ServerConfig config;
    try {
        config = loadServerConfig(configPath);
        configureLogging(config, false);
        controller = std::make_unique<FilesystemController>(config);
    } catch (const std::exception& e) {
        std::cerr << "Failed to start mcp-filesystem-stream: " << e.what() << std::endl;
        return 1;
    }

    controller->changeNotifier().setListener([](const ChangeRecord&) {
        Json::Value params;
        params["uri"] = FilesystemController::kChangesUri;
        sendNotification("notifications/resources/updated", params);
    });

    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        app().loadConfigFile(configPath);
    } else {
        app().addListener("0.0.0.0", static_cast<uint16_t>(config.port));
    }

    // HTTP JSON-RPC endpoint
    app().registerHandler("/mcp",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleMcpRequest(req, std::move(callback));
        },
        {Post});

    // SSE endpoint for notifications
    app().registerHandler("/mcp/events",
        [](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleSSE(req, std::move(callback));
        },
        {Get});

    // CORS support
    app().registerSyncAdvice([](const HttpRequestPtr& req) -> HttpResponsePtr {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            return resp;
        }
        return nullptr;
    });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    spdlog::info("MCP stream server starting");
    spdlog::info("  HTTP endpoint: /mcp");
    spdlog::info("  SSE endpoint: /mcp/events");
    app().run();

    controller->changeNotifier().stop();
    return 0;
}
