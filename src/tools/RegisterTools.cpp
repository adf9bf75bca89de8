#include "RegisterTools.hpp"
#include "ListAccessibleCustomersTool.hpp"
#include "SearchTool.hpp"

namespace ads_mcp {

void register_ads_tools(ToolRegistry& registry, std::shared_ptr<IAdsService> service) {
    auto search_tool = std::make_shared<SearchTool>(service);
    registry.register_tool(
        SearchTool::get_info(),
        [search_tool](const json& args) {
            return search_tool->execute(args);
        }
    );

    auto customers_tool = std::make_shared<ListAccessibleCustomersTool>(service);
    registry.register_tool(
        ListAccessibleCustomersTool::get_info(),
        [customers_tool](const json& args) {
            return customers_tool->execute(args);
        }
    );
}

} // namespace ads_mcp
