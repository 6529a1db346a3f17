#pragma once
#include <cstdint>
#include <string>
#include <spdlog/common.h>

struct ServerConfig {
    std::string baseDir;  // empty means the working directory
    std::string logLevel = "info";
    std::uintmax_t maxReadBytes = 10 * 1024 * 1024;
    bool watchChanges = true;
    size_t changeCapacity = 100;
    int port = 8080;  // HTTP transport, used when config.json has no listeners
};

// Defaults, then the "mcp" section of `configPath` if the file exists, then
// MCP_BASE_DIR, LOG_LEVEL, MCP_MAX_READ_BYTES, MCP_WATCH_CHANGES and MCP_PORT.
// Throws std::invalid_argument on malformed values.
ServerConfig loadServerConfig(const std::string& configPath = "config.json");

spdlog::level::level_enum parseLogLevel(const std::string& name);

// Installs the default logger. The stdio server must keep stdout clean.
void configureLogging(const ServerConfig& config, bool logToStderr);
