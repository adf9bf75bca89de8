#include "ToolRegistry.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ads_mcp {

void ToolRegistry::register_tool(const ToolInfo& info, ToolHandler handler) {
    if (info.name.empty()) {
        throw std::invalid_argument("Tool name cannot be empty");
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler cannot be null");
    }
    if (tools_.count(info.name) != 0) {
        throw std::invalid_argument("Tool already registered: " + info.name);
    }

    tools_.emplace(info.name, RegisteredTool{info, std::move(handler)});
    order_.push_back(info.name);
    spdlog::info("Registered tool: {}", info.name);
}

std::vector<ToolInfo> ToolRegistry::list_tools() const {
    std::vector<ToolInfo> result;
    result.reserve(order_.size());
    for (const auto& name : order_) {
        result.push_back(tools_.at(name).info);
    }
    return result;
}

const RegisteredTool* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

} // namespace ads_mcp
