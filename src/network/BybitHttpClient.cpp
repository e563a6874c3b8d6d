#include "network/BybitHttpClient.h"
#include "network/RequestSigner.h"
#include "resilience/BotError.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

namespace dcabot {
namespace network {

using resilience::BotError;
using resilience::ErrorCategory;

namespace {
bool isSensitiveKey(const std::string& key) {
    static const std::set<std::string> kKeys = {
        "api_key", "apikey", "secret", "api_secret", "sign", "signature",
        "x-bapi-sign", "x-bapi-api-key", "token"
    };
    std::string lower = key;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return kKeys.find(lower) != kKeys.end();
}

void maskSensitiveJson(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (isSensitiveKey(it.key())) {
                it.value() = "***";
            } else {
                maskSensitiveJson(it.value());
            }
        }
        return;
    }
    if (node.is_array()) {
        for (auto& item : node) {
            maskSensitiveJson(item);
        }
    }
}

// Bybit v5 공통 코드
constexpr int kInvalidApiKey = 10003;
constexpr int kInvalidSignature = 10004;
constexpr int kPermissionDenied = 10005;
constexpr int kRateLimitExceeded = 10006;
constexpr int kParamsError = 10001;
constexpr int kTimestampError = 10002;
constexpr int kInsufficientBalance = 110007;
}

std::string sanitizeForLog(const std::string& text) {
    if (!nlohmann::json::accept(text)) {
        return text;
    }
    auto j = nlohmann::json::parse(text);
    maskSensitiveJson(j);
    return j.dump();
}

nlohmann::json unwrapBybitResult(const HttpResponse& response, const std::string& operation) {
    if (response.isRateLimited()) {
        throw BotError(ErrorCategory::RATE_LIMIT, operation + ": too many requests (HTTP 429)", 429);
    }
    if (response.isUnauthorized()) {
        throw BotError(ErrorCategory::CREDENTIALS,
                       operation + ": unauthorized (HTTP " + std::to_string(response.status_code) + ")",
                       response.status_code);
    }
    if (response.isServerError()) {
        throw BotError(ErrorCategory::TEMPORARY,
                       operation + ": venue unavailable (HTTP " + std::to_string(response.status_code) + ")",
                       response.status_code);
    }
    if (!nlohmann::json::accept(response.body)) {
        throw BotError(ErrorCategory::TEMPORARY,
                       operation + ": malformed response (HTTP " + std::to_string(response.status_code) + ")");
    }

    const auto j = response.json();
    const int ret_code = j.value("retCode", -1);
    const std::string ret_msg = j.value("retMsg", std::string());

    if (ret_code == 0) {
        return j.contains("result") ? j["result"] : nlohmann::json::object();
    }

    const std::string message = operation + ": Bybit API error " + std::to_string(ret_code) + ": " + ret_msg;
    switch (ret_code) {
        case kInvalidApiKey:
        case kInvalidSignature:
        case kPermissionDenied:
            throw BotError(ErrorCategory::CREDENTIALS, message, ret_code);
        case kRateLimitExceeded:
            throw BotError(ErrorCategory::RATE_LIMIT, message, ret_code);
        case kTimestampError:
            throw BotError(ErrorCategory::TEMPORARY, message, ret_code);
        case kParamsError:
            throw BotError(ErrorCategory::VALIDATION, message, ret_code);
        case kInsufficientBalance:
            throw BotError(ErrorCategory::ORDER, message, false, ret_code);
        default:
            throw BotError(ErrorCategory::ORDER, message, ret_code);
    }
}

BybitHttpClient::BybitHttpClient(const std::string& api_key, const std::string& api_secret,
                                 BybitClientOptions options)
    : api_key_(api_key)
    , api_secret_(api_secret)
    , options_(std::move(options))
{
    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();

    if (!curl_) {
        throw BotError(ErrorCategory::FATAL, "Failed to initialize CURL");
    }
}

BybitHttpClient::~BybitHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

HttpResponse BybitHttpClient::get(
    const std::string& endpoint,
    const std::map<std::string, std::string>& query_params,
    bool authenticated
) {
    const std::string query = buildQueryString(query_params);
    std::string url = options_.base_url + endpoint;
    if (!query.empty()) {
        url += "?" + query;
    }

    std::map<std::string, std::string> headers;
    if (authenticated) {
        headers = RequestSigner::buildHeaders(api_key_, api_secret_,
                                              RequestSigner::currentTimestampMs(),
                                              options_.recv_window_ms, query);
    }

    LOG_DEBUG("GET {} {}", endpoint, query);
    return performRequest("GET", url, "", headers);
}

HttpResponse BybitHttpClient::post(
    const std::string& endpoint,
    const nlohmann::json& body
) {
    const std::string url = options_.base_url + endpoint;
    const std::string body_str = body.dump();

    auto headers = RequestSigner::buildHeaders(api_key_, api_secret_,
                                               RequestSigner::currentTimestampMs(),
                                               options_.recv_window_ms, body_str);
    headers["Content-Type"] = "application/json";

    LOG_DEBUG("POST {} {}", endpoint, sanitizeForLog(body_str));
    return performRequest("POST", url, body_str, headers);
}

HttpResponse BybitHttpClient::performRequest(
    const std::string& method,
    const std::string& url,
    const std::string& body_data,
    const std::map<std::string, std::string>& headers
) {
    std::lock_guard<std::mutex> lock(mutex_);

    HttpResponse response;
    std::string response_body;
    std::map<std::string, std::string> response_headers;

    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl_, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl_, CURLOPT_HEADERDATA, &response_headers);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, static_cast<long>(options_.timeout_seconds));
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (method == "POST") {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, body_data.c_str());
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        std::string header_line = key + ": " + value;
        header_list = curl_slist_append(header_list, header_line.c_str());
    }
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, header_list);

    CURLcode res = curl_easy_perform(curl_);
    curl_slist_free_all(header_list);

    if (res == CURLE_OPERATION_TIMEDOUT) {
        throw BotError(ErrorCategory::TIMEOUT, "request timeout: " + std::string(curl_easy_strerror(res)));
    }
    if (res != CURLE_OK) {
        throw BotError(ErrorCategory::NETWORK, "network error: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);

    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_body);
    response.headers = std::move(response_headers);

    if (!response.isSuccess()) {
        LOG_WARN("HTTP {} {} -> {} {}", method, url.substr(0, url.find('?')),
                 response.status_code, sanitizeForLog(response.body));
    }
    return response;
}

size_t BybitHttpClient::writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* response_body = static_cast<std::string*>(userp);
    response_body->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t BybitHttpClient::headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t total_size = size * nitems;
    std::string header_line(buffer, total_size);

    size_t colon_pos = header_line.find(':');
    if (colon_pos != std::string::npos) {
        std::string key = header_line.substr(0, colon_pos);
        std::string value = header_line.substr(colon_pos + 1);

        value.erase(0, value.find_first_not_of(" \t\r\n"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);

        auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
        (*headers)[key] = value;
    }

    return total_size;
}

std::string BybitHttpClient::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

} // namespace network
} // namespace dcabot
