#include "MethodHandlers.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>

namespace ads_mcp {

MethodHandlers::MethodHandlers(std::shared_ptr<const IToolRegistry> registry, ServerInfo info)
    : registry_(registry), executor_(registry), info_(std::move(info)) {}

json MethodHandlers::initialize(const json& params) const {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& client = params["clientInfo"];
        spdlog::info("Client: {} version {}",
                     client.value("name", std::string("unknown")),
                     client.value("version", std::string("unknown")));
    }

    return {
        {"protocolVersion", info_.protocol_version},
        {"capabilities", {
            {"tools", json::object()},
            {"resources", json::object()}
        }},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    };
}

json MethodHandlers::tools_list(const json&) const {
    std::vector<ToolInfo> tools;
    try {
        tools = registry_->list_tools();
        if (tools.empty()) {
            spdlog::warn("Tool registry is empty, using fallback tool definitions");
            tools = fallback_tools();
        }
    } catch (const std::exception& e) {
        spdlog::error("Error enumerating tools, using fallback tool definitions: {}", e.what());
        tools = fallback_tools();
    }

    json tools_array = json::array();
    for (const auto& tool : tools) {
        tools_array.push_back(describe(tool));
    }

    spdlog::debug("Returning {} tools", tools_array.size());
    return {{"tools", tools_array}};
}

json MethodHandlers::tools_call(const json& params) const {
    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        throw InvalidParamsError("Missing required parameter: name");
    }
    std::string tool_name = name_it->get<std::string>();

    json arguments = json::object();
    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            throw InvalidParamsError("Parameter 'arguments' must be an object");
        }
        arguments = *args_it;
    }

    spdlog::info("Calling tool: {}", tool_name);
    spdlog::debug("Tool {} arguments: {}", tool_name, arguments.dump());

    auto blocks = executor_.execute(tool_name, arguments);
    return {
        {"content", to_json(blocks)},
        {"isError", false}
    };
}

json MethodHandlers::resources_list(const json&) const {
    return {{"resources", json::array()}};
}

json MethodHandlers::describe(const ToolInfo& info) {
    return {
        {"name", info.name},
        {"description", info.description},
        {"inputSchema", info.input_schema}
    };
}

std::vector<ToolInfo> MethodHandlers::fallback_tools() {
    json string_array = {{"type", "array"}, {"items", {{"type", "string"}}}};
    return {
        {
            "search",
            "Retrieves information about the Google Ads account using GAQL queries",
            {
                {"type", "object"},
                {"properties", {
                    {"customer_id", {{"type", "string"}}},
                    {"resource", {{"type", "string"}}},
                    {"fields", string_array},
                    {"conditions", string_array},
                    {"orderings", string_array},
                    {"limit", {{"type", json::array({"integer", "string"})}}}
                }},
                {"required", json::array({"customer_id", "fields", "resource"})}
            }
        },
        {
            "list_accessible_customers",
            "Returns ids of customers directly accessible by the user authenticating the call",
            {
                {"type", "object"},
                {"properties", json::object()}
            }
        }
    };
}

} // namespace ads_mcp
