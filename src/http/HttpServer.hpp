#pragma once

#include "mcp/MCPServer.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
class Server;
struct Request;
struct Response;
}

namespace ads_mcp {

/**
 * @brief Listener settings for the HTTP transport
 */
struct HttpServerOptions {
    std::string host = "0.0.0.0";
    int port = 8080;                      ///< 0 binds an ephemeral port
    std::string cors_origin = "*";        ///< Empty disables CORS headers
    int sse_keepalive_seconds = 30;
    size_t max_payload_bytes = 10 * 1024 * 1024;
    size_t max_sse_streams = 16;          ///< Further GET /sse requests get 503
    size_t rpc_threads = 8;               ///< Workers left for POST requests when all streams are open
};

/**
 * @brief HTTP entry points for the MCP dispatcher
 *
 * Routes:
 * - POST /, POST /messages: JSON-RPC body in, JSON-RPC body out (always 200)
 * - GET /sse: event stream announcing the connection, then keepalives
 * - POST /sse: JSON-RPC body in, one SSE "message" event out
 * - GET /health: static liveness probe
 *
 * All JSON-RPC routes call the same MCPServer::dispatch(), so behavior does
 * not depend on which path a client targets. Each open stream pins one
 * worker thread; the pool is sized max_sse_streams + rpc_threads so streams
 * never starve POST requests.
 */
class HttpServer {
public:
    HttpServer(std::shared_ptr<const MCPServer> dispatcher, HttpServerOptions options);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and start serving on a background thread
     * @return false if already running or the address could not be bound
     */
    bool start();

    /**
     * @brief Stop listening and close open SSE streams; safe to call repeatedly
     */
    void stop();

    bool running() const { return running_.load(); }

    /**
     * @brief Number of GET /sse streams currently held open
     */
    size_t active_streams() const;

    /**
     * @brief Port actually bound (differs from options when port 0 was requested)
     */
    int port() const { return bound_port_; }

    const std::string& host() const { return options_.host; }

    /**
     * @brief Body returned by GET /health
     */
    static std::string health_body();

    /**
     * @brief First event written on every GET /sse stream
     */
    static std::string sse_connection_event();

private:
    void setup_routes();
    void handle_rpc(const httplib::Request& req, httplib::Response& res) const;
    void handle_rpc_as_event(const httplib::Request& req, httplib::Response& res) const;
    void handle_sse_stream(const httplib::Request& req, httplib::Response& res);
    void handle_preflight(const httplib::Request& req, httplib::Response& res) const;

    std::shared_ptr<const MCPServer> dispatcher_;
    HttpServerOptions options_;
    std::unique_ptr<httplib::Server> svr_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    int bound_port_ = -1;

    mutable std::mutex stream_mutex_;
    std::condition_variable stream_cv_;
    bool stopping_ = false;
    size_t active_streams_ = 0;
};

} // namespace ads_mcp
