#pragma once

#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ads_mcp {

using json = nlohmann::json;

/**
 * @brief Parts of a Google Ads Query Language SELECT statement
 */
struct GaqlQuery {
    std::string resource;
    std::vector<std::string> fields;
    std::vector<std::string> conditions;
    std::vector<std::string> orderings;
    std::optional<long long> limit;

    /**
     * @brief Render as "SELECT ... FROM ... [WHERE ...] [ORDER BY ...] [LIMIT n]"
     * @throws std::invalid_argument if resource or fields are empty
     */
    std::string to_string() const;
};

/**
 * @brief Strip dashes from a customer id ("123-456-7890" -> "1234567890")
 * @throws std::invalid_argument if the result is empty or not all digits
 */
std::string normalize_customer_id(const std::string& customer_id);

/**
 * @brief Convert a GAQL path segment to its REST JSON name ("cost_micros" -> "costMicros")
 */
std::string snake_to_camel(const std::string& segment);

/**
 * @brief Project a REST search row onto the requested GAQL fields
 *
 * Each field such as "metrics.cost_micros" is resolved segment by segment
 * against the camelCase row; absent values become null.
 *
 * @return Object keyed by the original field names
 */
json format_row(const json& row, const std::vector<std::string>& fields);

} // namespace ads_mcp
