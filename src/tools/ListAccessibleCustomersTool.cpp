#include "ListAccessibleCustomersTool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ads_mcp {

ListAccessibleCustomersTool::ListAccessibleCustomersTool(std::shared_ptr<IAdsService> service)
    : service_(std::move(service)) {
    if (!service_) {
        throw std::invalid_argument("Ads service cannot be null");
    }
}

ToolInfo ListAccessibleCustomersTool::get_info() {
    return {
        "list_accessible_customers",
        "Returns ids of customers directly accessible by the user authenticating the call",
        {
            {"type", "object"},
            {"properties", json::object()}
        }
    };
}

json ListAccessibleCustomersTool::execute(const json&) {
    static const std::string prefix = "customers/";

    json ids = json::array();
    for (const auto& resource_name : service_->list_accessible_customers()) {
        if (resource_name.compare(0, prefix.size(), prefix) == 0) {
            ids.push_back(resource_name.substr(prefix.size()));
        } else {
            ids.push_back(resource_name);
        }
    }

    spdlog::debug("ListAccessibleCustomersTool: {} customers", ids.size());
    return ids;
}

} // namespace ads_mcp
