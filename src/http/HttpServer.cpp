#include "HttpServer.hpp"
#include "Version.hpp"
#include <algorithm>
#include <chrono>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ads_mcp {

namespace {

constexpr const char* kJsonType = "application/json";
constexpr const char* kEventStreamType = "text/event-stream";

} // namespace

HttpServer::HttpServer(std::shared_ptr<const MCPServer> dispatcher, HttpServerOptions options)
    : dispatcher_(std::move(dispatcher)), options_(std::move(options)) {
    if (!dispatcher_) {
        throw std::invalid_argument("Dispatcher cannot be null");
    }
}

HttpServer::~HttpServer() {
    stop();
}

std::string HttpServer::health_body() {
    return json{{"status", "healthy"}, {"service", kServerName}}.dump();
}

std::string HttpServer::sse_connection_event() {
    json event = {
        {"type", "connection"},
        {"status", "connected"},
        {"note", "Use POST /messages for requests"}
    };
    return "data: " + event.dump() + "\n\n";
}

bool HttpServer::start() {
    if (running_) {
        return false;
    }

    svr_ = std::make_unique<httplib::Server>();
    svr_->set_payload_max_length(options_.max_payload_bytes);
    svr_->set_read_timeout(30, 0);
    svr_->set_write_timeout(30, 0);
    const size_t pool_size = options_.max_sse_streams + std::max<size_t>(options_.rpc_threads, 1);
    svr_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stopping_ = false;
    }
    setup_routes();

    if (options_.port == 0) {
        bound_port_ = svr_->bind_to_any_port(options_.host);
    } else if (svr_->bind_to_port(options_.host, options_.port)) {
        bound_port_ = options_.port;
    } else {
        bound_port_ = -1;
    }

    if (bound_port_ <= 0) {
        spdlog::error("Failed to bind HTTP server to {}:{}", options_.host, options_.port);
        svr_.reset();
        return false;
    }

    running_ = true;
    thread_ = std::thread([this]() {
        svr_->listen_after_bind();
        running_ = false;
    });
    // stop() is a no-op until the accept loop is running
    svr_->wait_until_ready();

    spdlog::info("HTTP server listening on {}:{}", options_.host, bound_port_);
    return true;
}

size_t HttpServer::active_streams() const {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    return active_streams_;
}

void HttpServer::stop() {
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        stopping_ = true;
    }
    stream_cv_.notify_all();

    if (svr_) {
        svr_->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    running_ = false;
    svr_.reset();
}

void HttpServer::setup_routes() {
    if (!options_.cors_origin.empty()) {
        svr_->set_default_headers({{"Access-Control-Allow-Origin", options_.cors_origin}});
    }

    svr_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(health_body(), kJsonType);
    });

    auto rpc = [this](const httplib::Request& req, httplib::Response& res) {
        handle_rpc(req, res);
    };
    svr_->Post("/", rpc);
    svr_->Post("/messages", rpc);

    svr_->Get("/sse", [this](const httplib::Request& req, httplib::Response& res) {
        handle_sse_stream(req, res);
    });
    svr_->Post("/sse", [this](const httplib::Request& req, httplib::Response& res) {
        handle_rpc_as_event(req, res);
    });

    svr_->Options(R"(/.*)", [this](const httplib::Request& req, httplib::Response& res) {
        handle_preflight(req, res);
    });
}

void HttpServer::handle_rpc(const httplib::Request& req, httplib::Response& res) const {
    try {
        res.set_content(dispatcher_->dispatch(req.body), kJsonType);
        res.status = 200;
    } catch (const std::exception& e) {
        spdlog::error("Error handling request on {}: {}", req.path, e.what());
        res.status = 500;
        res.set_content(make_error(nullptr, ErrorCode::InternalError, "Internal error").dump(),
                        kJsonType);
    }
}

void HttpServer::handle_rpc_as_event(const httplib::Request& req, httplib::Response& res) const {
    try {
        std::string event = "event: message\ndata: " + dispatcher_->dispatch(req.body) + "\n\n";
        res.set_header("Cache-Control", "no-cache");
        res.set_content(event, kEventStreamType);
        res.status = 200;
    } catch (const std::exception& e) {
        spdlog::error("Error handling request on {}: {}", req.path, e.what());
        res.status = 500;
        res.set_content(make_error(nullptr, ErrorCode::InternalError, "Internal error").dump(),
                        kJsonType);
    }
}

void HttpServer::handle_sse_stream(const httplib::Request&, httplib::Response& res) {
    {
        std::lock_guard<std::mutex> lock(stream_mutex_);
        if (active_streams_ >= options_.max_sse_streams) {
            spdlog::warn("Rejecting SSE connection, {} streams already open", active_streams_);
            res.status = 503;
            res.set_header("Retry-After", "5");
            res.set_content(json{{"error", "Too many open event streams"}}.dump(), kJsonType);
            return;
        }
        ++active_streams_;
    }

    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");

    spdlog::info("SSE connection opened");
    res.set_chunked_content_provider(
        kEventStreamType,
        [this](size_t /*offset*/, httplib::DataSink& sink) {
            std::string welcome = sse_connection_event();
            if (!sink.write(welcome.data(), welcome.size())) {
                return false;
            }

            const auto interval = std::chrono::seconds(options_.sse_keepalive_seconds);
            std::unique_lock<std::mutex> lock(stream_mutex_);
            while (!stopping_) {
                if (stream_cv_.wait_for(lock, interval, [this] { return stopping_; })) {
                    break;
                }
                lock.unlock();
                static const std::string keepalive = ": keepalive\n\n";
                bool written = sink.write(keepalive.data(), keepalive.size());
                lock.lock();
                if (!written) {
                    break;
                }
            }
            lock.unlock();

            sink.done();
            return true;
        },
        [this](bool /*success*/) {
            std::lock_guard<std::mutex> lock(stream_mutex_);
            --active_streams_;
            spdlog::info("SSE connection closed");
        });
}

void HttpServer::handle_preflight(const httplib::Request& req, httplib::Response& res) const {
    res.status = 204;
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    std::string requested = req.get_header_value("Access-Control-Request-Headers");
    res.set_header("Access-Control-Allow-Headers",
                   requested.empty() ? "Content-Type, Authorization" : requested);
    res.set_header("Access-Control-Max-Age", "600");
}

} // namespace ads_mcp
