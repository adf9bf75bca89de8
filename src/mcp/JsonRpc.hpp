#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace ads_mcp {

using json = nlohmann::json;

constexpr const char* kJsonRpcVersion = "2.0";

/**
 * @brief JSON-RPC 2.0 reserved codes plus the MCP tool-specific codes
 */
enum class ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
    ToolNotFound = -32001,
    ToolExecutionFailed = -32002
};

/**
 * @brief Build a success response envelope
 * @param id Request id (string, number or null)
 * @param result Method-specific result payload
 */
json make_result(const json& id, json result);

/**
 * @brief Build an error response envelope
 * @param id Request id (string, number or null)
 * @param code JSON-RPC error code
 * @param message Human-readable description
 */
json make_error(const json& id, ErrorCode code, const std::string& message);

/**
 * @brief Check that a value may be used as a JSON-RPC id
 *
 * Valid ids are strings, numbers and null.
 */
bool is_valid_id(const json& id);

/**
 * @brief Recover the top-level "id" member from a payload that failed to parse
 *
 * Degraded mode for parse errors: walks at most the first 64 KiB of the raw
 * text tracking string and nesting state, and only accepts an "id" key at
 * object depth one followed by a string, number or null literal.
 *
 * @param raw Raw request text
 * @return The recovered id, or null when none could be found
 */
json scan_request_id(const std::string& raw);

} // namespace ads_mcp
