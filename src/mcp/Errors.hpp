#pragma once

#include "JsonRpc.hpp"
#include <stdexcept>
#include <string>

namespace ads_mcp {

/**
 * @brief Base class for failures that map onto a JSON-RPC error code
 *
 * Thrown anywhere below the dispatcher; MCPServer converts it into an
 * error response carrying code() and what().
 */
class McpError : public std::runtime_error {
public:
    McpError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class InvalidParamsError : public McpError {
public:
    explicit InvalidParamsError(const std::string& message)
        : McpError(ErrorCode::InvalidParams, message) {}
};

class ToolNotFoundError : public McpError {
public:
    explicit ToolNotFoundError(const std::string& tool_name)
        : McpError(ErrorCode::ToolNotFound, "Tool not found: " + tool_name),
          tool_name_(tool_name) {}

    const std::string& tool_name() const { return tool_name_; }

private:
    std::string tool_name_;
};

/**
 * @brief A tool callable failed or rejected its arguments
 */
class ToolExecutionError : public McpError {
public:
    ToolExecutionError(const std::string& tool_name, const std::string& cause)
        : McpError(ErrorCode::ToolExecutionFailed,
                   "Error executing tool " + tool_name + ": " + cause),
          tool_name_(tool_name), cause_(cause) {}

    const std::string& tool_name() const { return tool_name_; }
    const std::string& cause() const { return cause_; }

private:
    std::string tool_name_;
    std::string cause_;
};

/**
 * @brief A tool returned a value that cannot be turned into content blocks
 */
class NormalizationError : public McpError {
public:
    explicit NormalizationError(const std::string& message)
        : McpError(ErrorCode::InternalError, message) {}
};

} // namespace ads_mcp
