#pragma once

#include "mcp/ITransport.hpp"
#include <queue>
#include <string>
#include <nlohmann/json.hpp>

namespace ads_mcp {

/**
 * @brief Mock transport for testing MCP server
 *
 * Uses queues for simulating request/response flow without actual I/O
 */
class MockTransport : public ITransport {
public:
    MockTransport() = default;

    std::optional<std::string> read_message() override;
    void write_message(const std::string& message) override;
    bool is_open() const override;

    /**
     * @brief Add a raw request line to the input queue
     */
    void push_raw(const std::string& line);

    /**
     * @brief Add a JSON-RPC request to the input queue
     */
    void push_request(const nlohmann::json& request);

    /**
     * @brief Get and remove a parsed response from the output queue
     * @return JSON-RPC response, or null if none is pending
     */
    nlohmann::json pop_response();

    bool has_responses() const;
    size_t response_count() const { return responses_.size(); }

    /**
     * @brief Close the transport (causes read_message to return nullopt)
     */
    void close();

private:
    std::queue<std::string> requests_;
    std::queue<std::string> responses_;
    bool open_ = true;
};

} // namespace ads_mcp
