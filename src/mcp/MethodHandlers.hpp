#pragma once

#include "ToolExecutor.hpp"
#include "ToolRegistry.hpp"
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ads_mcp {

using json = nlohmann::json;

/**
 * @brief Name and version reported in the initialize handshake
 */
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
};

/**
 * @brief Result builders for the supported MCP methods
 *
 * Stateless apart from the read-only registry: each handler is a function
 * of its params. Failures are reported by throwing McpError subclasses.
 */
class MethodHandlers {
public:
    MethodHandlers(std::shared_ptr<const IToolRegistry> registry, ServerInfo info);

    /**
     * @brief Handle initialize method (MCP handshake)
     * @param params Client capabilities and info; not validated
     * @return Protocol version, server capabilities and server info
     */
    json initialize(const json& params) const;

    /**
     * @brief Handle tools/list method
     *
     * Falls back to fallback_tools() when the registry is empty or fails
     * during enumeration, so clients never see an empty catalog.
     */
    json tools_list(const json& params) const;

    /**
     * @brief Handle tools/call method
     * @param params {"name": string, "arguments": object (optional)}
     * @return {"content": [...], "isError": false}
     * @throws InvalidParamsError on a malformed name or arguments member
     */
    json tools_call(const json& params) const;

    /**
     * @brief Handle resources/list method; no resources are exposed
     */
    json resources_list(const json& params) const;

    /**
     * @brief Descriptors for the tools every deployment provides
     */
    static std::vector<ToolInfo> fallback_tools();

private:
    static json describe(const ToolInfo& info);

    std::shared_ptr<const IToolRegistry> registry_;
    ToolExecutor executor_;
    ServerInfo info_;
};

} // namespace ads_mcp
