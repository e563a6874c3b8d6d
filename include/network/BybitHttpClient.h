#pragma once

#include "network/IHttpClient.h"
#include <curl/curl.h>
#include <mutex>
#include <string>

namespace dcabot {
namespace network {

struct BybitClientOptions {
    std::string base_url = "https://api-demo.bybit.com";
    int recv_window_ms = 5000;
    int timeout_seconds = 30;
};

class BybitHttpClient : public IHttpClient {
public:
    BybitHttpClient(const std::string& api_key, const std::string& api_secret,
                    BybitClientOptions options = BybitClientOptions());
    ~BybitHttpClient();

    BybitHttpClient(const BybitHttpClient&) = delete;
    BybitHttpClient& operator=(const BybitHttpClient&) = delete;

    HttpResponse get(
        const std::string& endpoint,
        const std::map<std::string, std::string>& query_params = {},
        bool authenticated = false
    ) override;

    HttpResponse post(
        const std::string& endpoint,
        const nlohmann::json& body
    ) override;

    static std::string buildQueryString(const std::map<std::string, std::string>& params);

private:
    std::string api_key_;
    std::string api_secret_;
    BybitClientOptions options_;
    CURL* curl_;
    std::mutex mutex_;

    HttpResponse performRequest(
        const std::string& method,
        const std::string& url,
        const std::string& body_data,
        const std::map<std::string, std::string>& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);
};

// retCode / HTTP 상태를 BotError 로 변환하고 성공이면 "result" 반환
nlohmann::json unwrapBybitResult(const HttpResponse& response, const std::string& operation);

// 민감한 키(api_key, sign, secret ...) 값을 가린 로그용 문자열
std::string sanitizeForLog(const std::string& text);

} // namespace network
} // namespace dcabot
