#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ads_mcp {

using json = nlohmann::json;

/**
 * @brief Metadata for an MCP tool
 */
struct ToolInfo {
    std::string name;
    std::string description;
    json input_schema;  // JSON Schema for tool arguments
};

/**
 * @brief Function signature for tool execution
 * @param args JSON object with tool arguments
 * @return The tool's native result; normalized into content blocks by ToolExecutor
 */
using ToolHandler = std::function<json(const json& args)>;

/**
 * @brief A registered tool: descriptor plus callable
 */
struct RegisteredTool {
    ToolInfo info;
    ToolHandler handler;
};

/**
 * @brief Read-only view of the tools exposed to MCP clients
 *
 * Populated once at startup and only read afterwards, so implementations
 * must tolerate unsynchronized concurrent reads.
 */
class IToolRegistry {
public:
    virtual ~IToolRegistry() = default;

    /**
     * @brief Enumerate tool descriptors in registration order
     */
    virtual std::vector<ToolInfo> list_tools() const = 0;

    /**
     * @brief Look up a tool by name
     * @return Pointer owned by the registry, or nullptr if unknown
     */
    virtual const RegisteredTool* find(const std::string& name) const = 0;
};

/**
 * @brief In-memory tool registry keyed by tool name
 */
class ToolRegistry : public IToolRegistry {
public:
    /**
     * @brief Register a tool with handler
     *
     * @throws std::invalid_argument on empty name, null handler or duplicate name
     */
    void register_tool(const ToolInfo& info, ToolHandler handler);

    std::vector<ToolInfo> list_tools() const override;
    const RegisteredTool* find(const std::string& name) const override;

    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, RegisteredTool> tools_;
    std::vector<std::string> order_;
};

} // namespace ads_mcp
