#pragma once

#include <optional>
#include <string>

namespace ads_mcp {

/**
 * @brief Abstract interface for stream-oriented MCP transports
 *
 * Implementations move raw JSON-RPC messages; parsing and validation are
 * left to the dispatcher so malformed input still gets a protocol answer.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next raw JSON-RPC message from transport
     * @return Message text (possibly empty for a blank line), or nullopt on EOF/error
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * @brief Write serialized JSON-RPC message to transport
     * @param message JSON text to write
     */
    virtual void write_message(const std::string& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace ads_mcp
