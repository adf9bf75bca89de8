#pragma once

#include "AdsCredentials.hpp"
#include "IAdsService.hpp"
#include <chrono>
#include <mutex>
#include <string>

namespace ads_mcp {

/**
 * @brief Endpoints and limits for RestAdsService
 */
struct RestAdsOptions {
    std::string api_base = "https://googleads.googleapis.com";
    std::string api_version = "v21";
    std::string token_url = "https://oauth2.googleapis.com/token";
    long timeout_seconds = 60;
};

/**
 * @brief Google Ads REST client over libcurl
 *
 * Exchanges the refresh token for an access token on first use and again
 * shortly before it expires; the cached token is shared by concurrent
 * callers under a mutex. Missing credentials are reported when a call is
 * made, not at construction, so the server can start without them.
 */
class RestAdsService : public IAdsService {
public:
    explicit RestAdsService(AdsCredentials credentials, RestAdsOptions options = RestAdsOptions());

    std::vector<std::string> list_accessible_customers() override;
    json search(const std::string& customer_id, const std::string& query) override;

private:
    struct HttpResult {
        long status = 0;
        std::string body;
    };

    std::string access_token();
    std::vector<std::string> api_headers();
    HttpResult perform(const std::string& url, const std::vector<std::string>& headers,
                       const std::string* post_body) const;
    static std::string api_error_message(const HttpResult& result);

    AdsCredentials credentials_;
    RestAdsOptions options_;

    std::mutex token_mutex_;
    std::string token_;
    std::chrono::steady_clock::time_point token_expiry_;
};

} // namespace ads_mcp
