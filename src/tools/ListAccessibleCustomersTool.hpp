#pragma once

#include "ads/IAdsService.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace ads_mcp {

/**
 * @brief MCP tool listing the customer ids the caller can access directly
 */
class ListAccessibleCustomersTool {
public:
    explicit ListAccessibleCustomersTool(std::shared_ptr<IAdsService> service);

    static ToolInfo get_info();

    /**
     * @brief Execute tool; takes no arguments
     * @return JSON array of customer ids ("customers/" prefix removed)
     */
    json execute(const json& args);

private:
    std::shared_ptr<IAdsService> service_;
};

} // namespace ads_mcp
