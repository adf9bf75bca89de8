#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ads_mcp {

using json = nlohmann::json;

/**
 * @brief Failure talking to the Google Ads API (credentials, network, API error)
 */
class AdsApiError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Google Ads operations used by the MCP tools
 */
class IAdsService {
public:
    virtual ~IAdsService() = default;

    /**
     * @brief Customers directly accessible by the authenticated user
     * @return Resource names, e.g. "customers/1234567890"
     * @throws AdsApiError
     */
    virtual std::vector<std::string> list_accessible_customers() = 0;

    /**
     * @brief Run a GAQL query and return every result row
     * @param customer_id Customer id without dashes
     * @param query GAQL query text
     * @return JSON array of REST result rows
     * @throws AdsApiError
     */
    virtual json search(const std::string& customer_id, const std::string& query) = 0;
};

} // namespace ads_mcp
