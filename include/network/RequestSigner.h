#pragma once

#include <map>
#include <string>

namespace dcabot {
namespace network {

// Bybit v5 서명: HMAC_SHA256(secret, timestamp + api_key + recv_window + payload) 의 hex
class RequestSigner {
public:
    static std::string hmacSha256Hex(const std::string& secret, const std::string& message);

    static std::map<std::string, std::string> buildHeaders(
        const std::string& api_key,
        const std::string& api_secret,
        long long timestamp_ms,
        int recv_window_ms,
        const std::string& payload
    );

    static long long currentTimestampMs();
};

} // namespace network
} // namespace dcabot
