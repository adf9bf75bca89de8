#include "Version.hpp"
#include "ads/AdsCredentials.hpp"
#include "ads/RestAdsService.hpp"
#include "config/ServerConfig.hpp"
#include "http/HttpServer.hpp"
#include "mcp/MCPServer.hpp"
#include "mcp/StdioTransport.hpp"
#include "tools/RegisterTools.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {
    std::atomic<bool> shutdown_requested{false};
    ads_mcp::MCPServer* global_server = nullptr;

    void signal_handler(int /*signal*/) {
        shutdown_requested = true;
        if (global_server) {
            global_server->stop();
        }
    }

    void setup_signal_handlers() {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
    }
}

int main(int argc, char** argv) {
    ads_mcp::ServerConfig config;
    try {
        config = ads_mcp::ServerConfig::from_env();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    // Parse command-line arguments
    CLI::App app{"Google Ads MCP Server"};
    config.add_options(app);

    bool version = false;
    app.add_flag("-v,--version", version, "Print version information");

    CLI11_PARSE(app, argc, argv);

    if (version) {
        std::cout << ads_mcp::kServerName << " version " << ads_mcp::kServerVersion << std::endl;
        return 0;
    }

    try {
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    // stdout carries the protocol in stdio mode
    if (config.transport == "stdio") {
        spdlog::set_default_logger(spdlog::stderr_color_mt("stderr"));
    }
    spdlog::set_level(*ads_mcp::parse_log_level(config.log_level));

    spdlog::info("Starting {} {} ({} transport)", ads_mcp::kServerName,
                 ads_mcp::kServerVersion, config.transport);

    try {
        setup_signal_handlers();

        auto credentials = ads_mcp::AdsCredentials::from_env();
        auto missing = credentials.missing();
        if (!missing.empty()) {
            spdlog::warn("Google Ads credentials incomplete ({} unset); tool calls will fail",
                         missing.size());
        }

        auto service = std::make_shared<ads_mcp::RestAdsService>(credentials);
        auto registry = std::make_shared<ads_mcp::ToolRegistry>();
        ads_mcp::register_ads_tools(*registry, service);

        auto server = std::make_shared<ads_mcp::MCPServer>(
            registry,
            ads_mcp::ServerInfo{ads_mcp::kServerName, ads_mcp::kServerVersion,
                                ads_mcp::kProtocolVersion},
            ads_mcp::Redactor(credentials.secrets()));

        spdlog::info("All tools registered, starting server");

        if (config.transport == "stdio") {
            ads_mcp::StdioTransport transport;
            global_server = server.get();
            server->run(transport);
            global_server = nullptr;
        } else {
            ads_mcp::HttpServer http(server, config.http_options());
            if (!http.start()) {
                spdlog::critical("Could not listen on {}:{}", config.host, config.port);
                return 1;
            }
            while (!shutdown_requested && http.running()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            http.stop();
        }

        spdlog::info("Server stopped cleanly");
        return 0;

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
