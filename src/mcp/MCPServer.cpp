#include "MCPServer.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

namespace ads_mcp {

MCPServer::MCPServer(std::shared_ptr<const IToolRegistry> registry, ServerInfo info,
                     Redactor redactor)
    : handlers_(std::move(registry), std::move(info)),
      routes_{
          {"initialize", &MethodHandlers::initialize},
          {"tools/list", &MethodHandlers::tools_list},
          {"tools/call", &MethodHandlers::tools_call},
          {"resources/list", &MethodHandlers::resources_list}
      },
      redactor_(std::move(redactor)) {
    spdlog::info("MCPServer initialized");
}

std::string MCPServer::dispatch(const std::string& raw) const {
    json response;
    try {
        json request = json::parse(raw);
        response = handle_request(request);
    } catch (const json::parse_error& e) {
        spdlog::warn("JSON parse error: {}", sanitize(e.what()));
        response = make_error(scan_request_id(raw), ErrorCode::ParseError, "Parse error");
    } catch (const std::exception& e) {
        std::string message = sanitize(std::string("Internal error: ") + e.what());
        spdlog::error("Error dispatching request: {}", message);
        response = make_error(scan_request_id(raw), ErrorCode::InternalError, message);
    }
    return serialize(response);
}

json MCPServer::handle_request(const json& request) const {
    if (!request.is_object()) {
        return make_error(nullptr, ErrorCode::InvalidRequest,
                          "Invalid Request: expected a JSON object");
    }

    json id = nullptr;
    auto id_it = request.find("id");
    if (id_it != request.end()) {
        if (!is_valid_id(*id_it)) {
            return make_error(nullptr, ErrorCode::InvalidRequest,
                              "Invalid Request: id must be a string, number or null");
        }
        id = *id_it;
    }

    auto version_it = request.find("jsonrpc");
    if (version_it != request.end() && *version_it != kJsonRpcVersion) {
        return make_error(id, ErrorCode::InvalidRequest,
                          "Invalid Request: unsupported jsonrpc version");
    }

    auto method_it = request.find("method");
    if (method_it == request.end() || !method_it->is_string() ||
        method_it->get_ref<const std::string&>().empty()) {
        return make_error(id, ErrorCode::InvalidRequest,
                          "Invalid Request: missing or invalid method field");
    }
    const std::string& method = method_it->get_ref<const std::string&>();

    json params = json::object();
    auto params_it = request.find("params");
    if (params_it != request.end() && !params_it->is_null()) {
        if (!params_it->is_object()) {
            return make_error(id, ErrorCode::InvalidParams,
                              "Invalid params: params must be an object");
        }
        params = *params_it;
    }

    spdlog::info("Handling MCP request: method={}, id={}", method, id.dump());

    auto route = routes_.find(method);
    if (route == routes_.end()) {
        return make_error(id, ErrorCode::MethodNotFound, "Method not found: " + method);
    }

    try {
        return make_result(id, (handlers_.*(route->second))(params));
    } catch (const McpError& e) {
        std::string message = sanitize(e.what());
        spdlog::error("Error handling method {}: {}", method, message);
        return make_error(id, e.code(), message);
    } catch (const std::exception& e) {
        std::string message = sanitize(std::string("Internal error: ") + e.what());
        spdlog::error("Error handling method {}: {}", method, message);
        return make_error(id, ErrorCode::InternalError, message);
    } catch (...) {
        spdlog::error("Unknown exception while handling method {}", method);
        return make_error(id, ErrorCode::InternalError, "Internal error: unknown exception");
    }
}

void MCPServer::run(ITransport& transport) {
    running_ = true;
    spdlog::info("MCPServer starting main loop");

    while (running_ && transport.is_open()) {
        auto message = transport.read_message();
        if (!message) {
            spdlog::info("Input closed, stopping server");
            break;
        }
        if (message->empty()) {
            continue;
        }

        try {
            transport.write_message(dispatch(*message));
        } catch (const std::exception& e) {
            spdlog::error("Failed to write response: {}", e.what());
            break;
        }
    }

    running_ = false;
    spdlog::info("MCPServer stopped");
}

void MCPServer::stop() {
    spdlog::info("MCPServer stop requested");
    running_ = false;
}

std::string MCPServer::sanitize(const std::string& message) const {
    return Redactor::truncate(redactor_.redact(message), kMaxErrorMessageLength);
}

std::string MCPServer::serialize(const json& response) {
    try {
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    } catch (const std::exception& e) {
        spdlog::error("Failed to serialize response: {}", e.what());
        return R"({"jsonrpc":"2.0","id":null,"error":{"code":-32603,"message":"Internal error: response could not be serialized"}})";
    }
}

} // namespace ads_mcp
