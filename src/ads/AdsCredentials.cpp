#include "AdsCredentials.hpp"

namespace ads_mcp {

AdsCredentials AdsCredentials::from_env(const EnvLookup& env) {
    AdsCredentials creds;
    creds.developer_token = env("GOOGLE_ADS_DEVELOPER_TOKEN").value_or("");
    creds.client_id = env("GOOGLE_ADS_CLIENT_ID").value_or("");
    creds.client_secret = env("GOOGLE_ADS_CLIENT_SECRET").value_or("");
    creds.refresh_token = env("GOOGLE_ADS_REFRESH_TOKEN").value_or("");
    creds.login_customer_id = env("GOOGLE_ADS_LOGIN_CUSTOMER_ID").value_or("");
    return creds;
}

std::vector<std::string> AdsCredentials::missing() const {
    std::vector<std::string> names;
    if (developer_token.empty()) names.push_back("GOOGLE_ADS_DEVELOPER_TOKEN");
    if (client_id.empty()) names.push_back("GOOGLE_ADS_CLIENT_ID");
    if (client_secret.empty()) names.push_back("GOOGLE_ADS_CLIENT_SECRET");
    if (refresh_token.empty()) names.push_back("GOOGLE_ADS_REFRESH_TOKEN");
    return names;
}

std::vector<std::string> AdsCredentials::secrets() const {
    return {developer_token, client_secret, refresh_token};
}

} // namespace ads_mcp
