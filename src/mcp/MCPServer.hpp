#pragma once

#include "ITransport.hpp"
#include "JsonRpc.hpp"
#include "MethodHandlers.hpp"
#include "ToolRegistry.hpp"
#include "util/Redactor.hpp"
#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace ads_mcp {

using json = nlohmann::json;

/**
 * @brief MCP dispatcher implementing JSON-RPC 2.0 protocol
 *
 * Every transport funnels raw request text into dispatch(), which always
 * returns exactly one serialized JSON-RPC response object and never throws.
 * Supports methods: initialize, tools/list, tools/call, resources/list
 */
class MCPServer {
public:
    /// Longest error message sent to a client or written to the log
    static constexpr size_t kMaxErrorMessageLength = 2048;

    /**
     * @brief Construct dispatcher over a populated tool registry
     * @param registry Read-only registry shared with concurrent requests
     * @param info Server name/version reported by initialize
     * @param redactor Scrubs secrets from error messages
     */
    MCPServer(std::shared_ptr<const IToolRegistry> registry, ServerInfo info,
              Redactor redactor = Redactor());

    /**
     * @brief Turn raw request bytes into raw response bytes
     *
     * Unparseable input yields a Parse error (-32700) whose id is recovered
     * with scan_request_id().
     */
    std::string dispatch(const std::string& raw) const;

    /**
     * @brief Handle an already-parsed JSON-RPC request
     * @param request Parsed payload of any JSON type
     * @return JSON-RPC response message (result or error)
     */
    json handle_request(const json& request) const;

    /**
     * @brief Serve a stream transport
     *
     * Blocks until stop() is called or transport closes. One response is
     * written for every non-blank line read.
     */
    void run(ITransport& transport);

    /**
     * @brief Signal run() to stop after the current message
     */
    void stop();

private:
    using Handler = json (MethodHandlers::*)(const json&) const;

    /**
     * @brief Redact and bound an error message before it is logged or returned
     */
    std::string sanitize(const std::string& message) const;
    static std::string serialize(const json& response);

    MethodHandlers handlers_;
    std::map<std::string, Handler> routes_;
    Redactor redactor_;
    std::atomic<bool> running_{false};
};

} // namespace ads_mcp
