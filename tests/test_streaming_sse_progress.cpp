#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <json/json.h>
#include "../src/FilesystemController.hpp"
#include "../src/SSEBroadcaster.hpp"
#include "TempTree.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        TempTree tree("sse");
        for (int i = 0; i < 4; ++i) {
            tree.write("logs/day" + std::to_string(i) + ".log", "start\nERROR disk full\nend\n");
        }

        ServerConfig config;
        config.baseDir = tree.root().string();
        config.watchChanges = false;
        FilesystemController controller(config);
        SSEBroadcaster broadcaster;

        // Subscribe to broadcaster events
        std::vector<std::string> captured;
        uint64_t id = broadcaster.subscribe([&captured](const std::string& e) {
            captured.push_back(e);
        });
        ASSERT_TRUE(broadcaster.subscriberCount() == 1);

        // Search and broadcast progress in callback
        Json::Value params;
        params["name"] = "search_files";
        params["arguments"]["pattern"] = "*.log";
        params["arguments"]["content_regex"] = "^ERROR";
        auto progressCb = [&broadcaster](const Json::Value& p) {
            std::string payload = Json::writeString(Json::StreamWriterBuilder(), p);
            broadcaster.broadcast("progress", payload);
        };

        Json::Value res = controller.callTool(params, progressCb);
        ASSERT_TRUE(!res.isMember("__error__"));
        ASSERT_TRUE(res["structuredContent"]["result"].size() == 4);
        ASSERT_TRUE(captured.size() == 4);

        // event: progress\ndata: <json>\n\n
        std::string last_event = captured.back();
        ASSERT_TRUE(last_event.rfind("event: progress\n", 0) == 0);
        auto pos = last_event.find("data: ");
        ASSERT_TRUE(pos != std::string::npos);
        std::string jsonPart = last_event.substr(pos + 6);
        // trim trailing newlines
        while (!jsonPart.empty() && (jsonPart.back() == '\n' || jsonPart.back() == '\r')) jsonPart.pop_back();
        Json::CharReaderBuilder reader;
        std::string errs;
        Json::Value parsed;
        std::istringstream iss(jsonPart);
        ASSERT_TRUE(Json::parseFromStream(reader, iss, &parsed, &errs));
        ASSERT_TRUE(parsed["files_done"].asUInt64() == 4);
        ASSERT_TRUE(parsed["files_total"].asUInt64() == 4);
        ASSERT_TRUE(parsed["progress"].asDouble() == 1.0);

        // unsubscribed clients stop receiving events
        broadcaster.unsubscribe(id);
        ASSERT_TRUE(broadcaster.subscriberCount() == 0);
        broadcaster.broadcast("progress", "{}");
        ASSERT_TRUE(captured.size() == 4);

        // a sender may drop itself while being called
        uint64_t selfId = 0;
        int calls = 0;
        selfId = broadcaster.subscribe([&](const std::string&) {
            ++calls;
            broadcaster.unsubscribe(selfId);
        });
        broadcaster.broadcast("message", "{}");
        broadcaster.broadcast("message", "{}");
        ASSERT_TRUE(calls == 1);

    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All streaming SSE progress tests passed" << std::endl;
    return 0;
}
