#pragma once

#include "ads/IAdsService.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace ads_mcp {

/**
 * @brief MCP tool running a GAQL query against one customer account
 *
 * Composes the query from its parts and returns one object per row keyed
 * by the requested field names.
 */
class SearchTool {
public:
    /**
     * @brief Construct tool with Ads service reference
     * @param service Google Ads service instance
     */
    explicit SearchTool(std::shared_ptr<IAdsService> service);

    /**
     * @brief Get tool metadata and JSON schema
     * @return ToolInfo with name, description, and input schema
     */
    static ToolInfo get_info();

    /**
     * @brief Execute tool with arguments
     * @param args customer_id, resource, fields, and optional conditions, orderings, limit
     * @return JSON array of formatted rows
     * @throws std::invalid_argument on malformed arguments, AdsApiError on API failure
     */
    json execute(const json& args);

private:
    std::shared_ptr<IAdsService> service_;
};

} // namespace ads_mcp
