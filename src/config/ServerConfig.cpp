#include "ServerConfig.hpp"
#include <CLI/CLI.hpp>
#include <stdexcept>

namespace ads_mcp {

namespace {

int parse_int(const std::string& name, const std::string& value) {
    try {
        size_t consumed = 0;
        int result = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return result;
    } catch (const std::exception&) {
        throw std::invalid_argument("Environment variable " + name + " is not a number: " + value);
    }
}

} // namespace

ServerConfig ServerConfig::from_env(const EnvLookup& env) {
    ServerConfig config;
    if (auto port = env("PORT")) {
        config.port = parse_int("PORT", *port);
    }
    if (auto host = env("ADS_MCP_HOST")) {
        config.host = *host;
    }
    if (auto transport = env("ADS_MCP_TRANSPORT")) {
        config.transport = *transport;
    }
    if (auto level = env("ADS_MCP_LOG_LEVEL")) {
        config.log_level = *level;
    }
    if (auto origin = env("ADS_MCP_CORS_ORIGIN")) {
        config.cors_origin = *origin;
    }
    if (auto keepalive = env("ADS_MCP_SSE_KEEPALIVE")) {
        config.sse_keepalive_seconds = parse_int("ADS_MCP_SSE_KEEPALIVE", *keepalive);
    }
    if (auto streams = env("ADS_MCP_MAX_SSE_STREAMS")) {
        config.max_sse_streams = parse_int("ADS_MCP_MAX_SSE_STREAMS", *streams);
    }
    return config;
}

void ServerConfig::add_options(CLI::App& app) {
    app.add_option("-t,--transport", transport, "Transport to serve (http, stdio)")
        ->check(CLI::IsMember({"http", "stdio"}))
        ->capture_default_str();
    app.add_option("--host", host, "Address to bind the HTTP server to")
        ->capture_default_str();
    app.add_option("-p,--port", port, "Port for the HTTP server")
        ->check(CLI::Range(0, 65535))
        ->capture_default_str();
    app.add_option("--sse-keepalive", sse_keepalive_seconds,
                   "Seconds between keepalive comments on SSE streams")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--max-sse-streams", max_sse_streams,
                   "Concurrent GET /sse streams before new ones are refused")
        ->check(CLI::PositiveNumber)
        ->capture_default_str();
    app.add_option("--cors-origin", cors_origin,
                   "Value of Access-Control-Allow-Origin (empty disables CORS)")
        ->capture_default_str();
    app.add_option("-l,--log-level", log_level,
                   "Log level (trace, debug, info, warn, error, critical)")
        ->capture_default_str();
}

void ServerConfig::validate() const {
    if (transport != "http" && transport != "stdio") {
        throw std::invalid_argument("Invalid transport: " + transport);
    }
    if (port < 0 || port > 65535) {
        throw std::invalid_argument("Invalid port: " + std::to_string(port));
    }
    if (sse_keepalive_seconds <= 0) {
        throw std::invalid_argument("SSE keepalive must be positive");
    }
    if (max_sse_streams <= 0) {
        throw std::invalid_argument("Max SSE streams must be positive");
    }
    if (!parse_log_level(log_level)) {
        throw std::invalid_argument("Invalid log level: " + log_level);
    }
}

HttpServerOptions ServerConfig::http_options() const {
    HttpServerOptions options;
    options.host = host;
    options.port = port;
    options.cors_origin = cors_origin;
    options.sse_keepalive_seconds = sse_keepalive_seconds;
    options.max_payload_bytes = max_payload_bytes;
    options.max_sse_streams = static_cast<size_t>(max_sse_streams);
    return options;
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

} // namespace ads_mcp
