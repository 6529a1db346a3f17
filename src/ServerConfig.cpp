#include "ServerConfig.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {

std::string getEnvStr(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseBool(const std::string& name, const std::string& value) {
    std::string v = toLower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(name + ": expected a boolean, got '" + value + "'");
}

std::uintmax_t parseSize(const std::string& name, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument(name + ": expected a non-negative integer, got '" + value + "'");
    }
    try {
        return static_cast<std::uintmax_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(name + ": value out of range: " + value);
    }
}

void applyJsonSection(const Json::Value& mcp, ServerConfig& config) {
    if (mcp.isMember("base_dir")) config.baseDir = mcp["base_dir"].asString();
    if (mcp.isMember("log_level")) config.logLevel = mcp["log_level"].asString();
    if (mcp.isMember("max_read_bytes")) config.maxReadBytes = mcp["max_read_bytes"].asUInt64();
    if (mcp.isMember("watch_changes")) config.watchChanges = mcp["watch_changes"].asBool();
    if (mcp.isMember("change_capacity")) config.changeCapacity = mcp["change_capacity"].asUInt();
    if (mcp.isMember("port")) config.port = mcp["port"].asInt();
}

}  // namespace

spdlog::level::level_enum parseLogLevel(const std::string& name) {
    std::string level = toLower(name);
    if (level == "warning") level = "warn";
    if (level == "error") level = "err";
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        throw std::invalid_argument("LOG_LEVEL: unknown level '" + name + "'");
    }
    return parsed;
}

ServerConfig loadServerConfig(const std::string& configPath) {
    ServerConfig config;

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        std::ifstream configFile(configPath);
        Json::Value root;
        Json::CharReaderBuilder builder;
        std::string errs;
        if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
            throw std::invalid_argument("Failed to parse " + configPath + ": " + errs);
        }
        if (root.isMember("mcp")) {
            try {
                applyJsonSection(root["mcp"], config);
            } catch (const Json::LogicError& e) {
                throw std::invalid_argument("Invalid 'mcp' section in " + configPath + ": " + e.what());
            }
        }
    }

    std::string baseDir = getEnvStr("MCP_BASE_DIR");
    if (!baseDir.empty()) config.baseDir = baseDir;
    std::string logLevel = getEnvStr("LOG_LEVEL");
    if (!logLevel.empty()) config.logLevel = logLevel;
    std::string maxRead = getEnvStr("MCP_MAX_READ_BYTES");
    if (!maxRead.empty()) config.maxReadBytes = parseSize("MCP_MAX_READ_BYTES", maxRead);
    std::string watch = getEnvStr("MCP_WATCH_CHANGES");
    if (!watch.empty()) config.watchChanges = parseBool("MCP_WATCH_CHANGES", watch);
    std::string port = getEnvStr("MCP_PORT");
    if (!port.empty()) {
        std::uintmax_t value = parseSize("MCP_PORT", port);
        if (value == 0 || value > 65535) {
            throw std::invalid_argument("MCP_PORT: out of range: " + port);
        }
        config.port = static_cast<int>(value);
    }

    if (config.baseDir.empty()) {
        config.baseDir = std::filesystem::current_path().string();
    }
    // validate early so a typo fails at startup
    parseLogLevel(config.logLevel);
    return config;
}

void configureLogging(const ServerConfig& config, bool logToStderr) {
    auto logger = logToStderr ? spdlog::stderr_color_mt("mcp-filesystem") : spdlog::stdout_color_mt("mcp-filesystem");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
    spdlog::set_level(parseLogLevel(config.logLevel));
}
