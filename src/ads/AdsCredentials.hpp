#pragma once

#include "config/Env.hpp"
#include <string>
#include <vector>

namespace ads_mcp {

/**
 * @brief OAuth client credentials and developer token for the Google Ads API
 */
struct AdsCredentials {
    std::string developer_token;
    std::string client_id;
    std::string client_secret;
    std::string refresh_token;
    std::string login_customer_id;  ///< optional manager account id

    /**
     * @brief Read GOOGLE_ADS_* variables; missing values are left empty
     */
    static AdsCredentials from_env(const EnvLookup& env = system_env);

    /**
     * @brief Names of required variables that are not set
     */
    std::vector<std::string> missing() const;

    /**
     * @brief Values that must never appear in responses or logs
     */
    std::vector<std::string> secrets() const;
};

} // namespace ads_mcp
