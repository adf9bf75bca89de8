#include "SearchTool.hpp"
#include "ads/Gaql.hpp"
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ads_mcp {

namespace {

std::vector<std::string> string_list(const json& args, const char* key) {
    std::vector<std::string> values;
    if (!args.contains(key) || args[key].is_null()) {
        return values;
    }
    for (const auto& item : args[key]) {
        values.push_back(item.get<std::string>());
    }
    return values;
}

std::optional<long long> parse_limit(const json& args) {
    if (!args.contains("limit") || args["limit"].is_null()) {
        return std::nullopt;
    }
    const auto& limit = args["limit"];
    long long value = 0;
    if (limit.is_number_integer()) {
        value = limit.get<long long>();
    } else if (limit.is_string()) {
        const auto& text = limit.get_ref<const std::string&>();
        size_t consumed = 0;
        try {
            value = std::stoll(text, &consumed);
        } catch (const std::exception&) {
            consumed = 0;
        }
        if (consumed == 0 || consumed != text.size()) {
            throw std::invalid_argument("limit must be an integer, got: " + text);
        }
    } else {
        throw std::invalid_argument("limit must be an integer");
    }
    if (value <= 0) {
        throw std::invalid_argument("limit must be positive");
    }
    return value;
}

} // namespace

SearchTool::SearchTool(std::shared_ptr<IAdsService> service)
    : service_(std::move(service)) {
    if (!service_) {
        throw std::invalid_argument("Ads service cannot be null");
    }
}

ToolInfo SearchTool::get_info() {
    return {
        "search",
        "Retrieves information about the Google Ads account using GAQL queries",
        {
            {"type", "object"},
            {"properties", {
                {"customer_id", {
                    {"type", "string"},
                    {"description", "The id of the customer, with or without dashes"}
                }},
                {"resource", {
                    {"type", "string"},
                    {"description", "The GAQL resource to query, e.g. campaign or ad_group"}
                }},
                {"fields", {
                    {"type", "array"},
                    {"items", {{"type", "string"}}},
                    {"description", "Fields to select, e.g. campaign.id, metrics.clicks"}
                }},
                {"conditions", {
                    {"type", "array"},
                    {"items", {{"type", "string"}}},
                    {"description", "WHERE conditions, combined with AND"}
                }},
                {"orderings", {
                    {"type", "array"},
                    {"items", {{"type", "string"}}},
                    {"description", "ORDER BY clauses, e.g. metrics.clicks DESC"}
                }},
                {"limit", {
                    {"type", json::array({"integer", "string"})},
                    {"description", "Maximum number of rows to return"}
                }}
            }},
            {"required", json::array({"customer_id", "fields", "resource"})}
        }
    };
}

json SearchTool::execute(const json& args) {
    GaqlQuery query;
    query.resource = args.value("resource", std::string());
    query.fields = string_list(args, "fields");
    query.conditions = string_list(args, "conditions");
    query.orderings = string_list(args, "orderings");
    query.limit = parse_limit(args);

    std::string customer_id = normalize_customer_id(args.value("customer_id", std::string()));
    std::string gaql = query.to_string();
    spdlog::debug("SearchTool: customer {} query: {}", customer_id, gaql);

    json rows = service_->search(customer_id, gaql);
    json formatted = json::array();
    for (const auto& row : rows) {
        formatted.push_back(format_row(row, query.fields));
    }
    return formatted;
}

} // namespace ads_mcp
