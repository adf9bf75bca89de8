#pragma once

#include "ads/IAdsService.hpp"
#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace ads_mcp {

/**
 * @brief Register search and list_accessible_customers backed by one Ads service
 */
void register_ads_tools(ToolRegistry& registry, std::shared_ptr<IAdsService> service);

} // namespace ads_mcp
