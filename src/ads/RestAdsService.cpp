#include "RestAdsService.hpp"
#include "Gaql.hpp"
#include <curl/curl.h>
#include <memory>
#include <spdlog/spdlog.h>

namespace ads_mcp {

namespace {

constexpr auto kTokenRefreshMargin = std::chrono::seconds(60);

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;

size_t write_callback(char* contents, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(contents, size * nmemb);
    return size * nmemb;
}

std::string url_encode(CURL* handle, const std::string& value) {
    char* escaped = curl_easy_escape(handle, value.c_str(), static_cast<int>(value.size()));
    if (escaped == nullptr) {
        throw AdsApiError("Failed to encode request parameter");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

} // namespace

RestAdsService::RestAdsService(AdsCredentials credentials, RestAdsOptions options)
    : credentials_(std::move(credentials)), options_(std::move(options)) {
    ensure_curl_initialized();
    if (!credentials_.login_customer_id.empty()) {
        credentials_.login_customer_id = normalize_customer_id(credentials_.login_customer_id);
    }
}

RestAdsService::HttpResult RestAdsService::perform(const std::string& url,
                                                   const std::vector<std::string>& headers,
                                                   const std::string* post_body) const {
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw AdsApiError("curl_easy_init() failed");
    }

    curl_slist* raw_list = nullptr;
    for (const auto& header : headers) {
        curl_slist* appended = curl_slist_append(raw_list, header.c_str());
        if (appended == nullptr) {
            curl_slist_free_all(raw_list);
            throw AdsApiError("Failed to build request headers");
        }
        raw_list = appended;
    }
    CurlHeaders header_list(raw_list);

    HttpResult result;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &result.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, options_.timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "google-ads-mcp");
    if (post_body != nullptr) {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, post_body->c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
    }

    CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
        throw AdsApiError(std::string("Request to Google Ads API failed: ") +
                          curl_easy_strerror(code));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
    return result;
}

std::string RestAdsService::api_error_message(const HttpResult& result) {
    std::string message = "HTTP " + std::to_string(result.status);
    json body = json::parse(result.body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("error")) {
        const auto& error = body["error"];
        if (error.is_object() && error.contains("message") && error["message"].is_string()) {
            message += ": " + error["message"].get<std::string>();
        } else if (error.is_string()) {
            message += ": " + error.get<std::string>();
        }
    }
    return message;
}

std::string RestAdsService::access_token() {
    std::lock_guard<std::mutex> lock(token_mutex_);

    auto missing = credentials_.missing();
    if (!missing.empty()) {
        std::string names;
        for (const auto& name : missing) {
            names += names.empty() ? name : ", " + name;
        }
        throw AdsApiError("Google Ads credentials are not configured; set " + names);
    }

    if (!token_.empty() && std::chrono::steady_clock::now() < token_expiry_) {
        return token_;
    }

    spdlog::info("Refreshing Google Ads OAuth access token");
    CurlHandle encoder(curl_easy_init());
    if (!encoder) {
        throw AdsApiError("curl_easy_init() failed");
    }
    std::string form = "grant_type=refresh_token"
                       "&client_id=" + url_encode(encoder.get(), credentials_.client_id) +
                       "&client_secret=" + url_encode(encoder.get(), credentials_.client_secret) +
                       "&refresh_token=" + url_encode(encoder.get(), credentials_.refresh_token);

    HttpResult result = perform(options_.token_url,
                                {"Content-Type: application/x-www-form-urlencoded"}, &form);
    if (result.status != 200) {
        throw AdsApiError("Failed to refresh OAuth credentials: " + api_error_message(result));
    }

    json body = json::parse(result.body, nullptr, false);
    if (body.is_discarded() || !body.contains("access_token") ||
        !body["access_token"].is_string()) {
        throw AdsApiError("Failed to refresh OAuth credentials: malformed token response");
    }

    token_ = body["access_token"].get<std::string>();
    auto lifetime = std::chrono::seconds(body.value("expires_in", 3600));
    token_expiry_ = std::chrono::steady_clock::now() + lifetime - kTokenRefreshMargin;
    spdlog::info("Successfully refreshed OAuth credentials");
    return token_;
}

std::vector<std::string> RestAdsService::api_headers() {
    std::vector<std::string> headers = {
        "Authorization: Bearer " + access_token(),
        "developer-token: " + credentials_.developer_token,
        "Content-Type: application/json"
    };
    if (!credentials_.login_customer_id.empty()) {
        headers.push_back("login-customer-id: " + credentials_.login_customer_id);
    }
    return headers;
}

std::vector<std::string> RestAdsService::list_accessible_customers() {
    std::string url = options_.api_base + "/" + options_.api_version +
                      "/customers:listAccessibleCustomers";
    HttpResult result = perform(url, api_headers(), nullptr);
    if (result.status != 200) {
        throw AdsApiError("listAccessibleCustomers failed: " + api_error_message(result));
    }

    json body = json::parse(result.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw AdsApiError("listAccessibleCustomers returned malformed JSON");
    }
    return body.value("resourceNames", std::vector<std::string>());
}

json RestAdsService::search(const std::string& customer_id, const std::string& query) {
    std::string url = options_.api_base + "/" + options_.api_version + "/customers/" +
                      normalize_customer_id(customer_id) + "/googleAds:search";

    json rows = json::array();
    std::string page_token;
    do {
        json request = {{"query", query}};
        if (!page_token.empty()) {
            request["pageToken"] = page_token;
        }
        std::string payload = request.dump();

        HttpResult result = perform(url, api_headers(), &payload);
        if (result.status != 200) {
            throw AdsApiError("search failed: " + api_error_message(result));
        }

        json body = json::parse(result.body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            throw AdsApiError("search returned malformed JSON");
        }
        if (body.contains("results") && body["results"].is_array()) {
            for (auto& row : body["results"]) {
                rows.push_back(std::move(row));
            }
        }
        page_token = body.value("nextPageToken", std::string());
    } while (!page_token.empty());

    spdlog::debug("search returned {} rows", rows.size());
    return rows;
}

} // namespace ads_mcp
