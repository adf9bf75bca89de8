#pragma once

#include "ads/IAdsService.hpp"
#include <string>
#include <utility>
#include <vector>

namespace ads_mcp {

/**
 * @brief In-memory Ads service recording the queries it receives
 */
class FakeAdsService : public IAdsService {
public:
    std::vector<std::string> list_accessible_customers() override {
        if (!failure.empty()) {
            throw AdsApiError(failure);
        }
        return customers;
    }

    json search(const std::string& customer_id, const std::string& query) override {
        if (!failure.empty()) {
            throw AdsApiError(failure);
        }
        queries.emplace_back(customer_id, query);
        return rows;
    }

    std::vector<std::string> customers;
    json rows = json::array();
    std::string failure;  ///< When set, every call throws AdsApiError with this message

    std::vector<std::pair<std::string, std::string>> queries;
};

} // namespace ads_mcp
