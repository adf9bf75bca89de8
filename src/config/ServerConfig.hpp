#pragma once

#include "Env.hpp"
#include "http/HttpServer.hpp"
#include <optional>
#include <string>
#include <spdlog/common.h>

namespace CLI {
class App;
}

namespace ads_mcp {

/**
 * @brief Runtime settings for the server process
 *
 * Precedence: built-in defaults, then environment (from_env), then
 * command-line options bound with add_options().
 */
struct ServerConfig {
    std::string transport = "http";   ///< "http" or "stdio"
    std::string host = "0.0.0.0";
    int port = 8080;
    int sse_keepalive_seconds = 30;
    std::string cors_origin = "*";
    size_t max_payload_bytes = 10 * 1024 * 1024;
    int max_sse_streams = 16;
    std::string log_level = "info";

    /**
     * @brief Defaults overridden by PORT, ADS_MCP_HOST, ADS_MCP_TRANSPORT,
     * ADS_MCP_LOG_LEVEL, ADS_MCP_CORS_ORIGIN, ADS_MCP_SSE_KEEPALIVE and
     * ADS_MCP_MAX_SSE_STREAMS
     *
     * @throws std::invalid_argument if a numeric variable is not a number
     */
    static ServerConfig from_env(const EnvLookup& env = system_env);

    /**
     * @brief Register command-line options writing into this config
     */
    void add_options(CLI::App& app);

    /**
     * @brief Check value ranges and enumerations
     * @throws std::invalid_argument describing the first bad setting
     */
    void validate() const;

    HttpServerOptions http_options() const;
};

/**
 * @brief Map a log level name (trace, debug, info, warn, error, critical, off)
 */
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace ads_mcp
