#include "network/RequestSigner.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace dcabot {
namespace network {

std::string RequestSigner::hmacSha256Hex(const std::string& secret, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const unsigned char* result = HMAC(
        EVP_sha256(),
        secret.data(), static_cast<int>(secret.size()),
        reinterpret_cast<const unsigned char*>(message.data()), message.size(),
        digest, &digest_len
    );
    if (result == nullptr) {
        throw std::runtime_error("HMAC-SHA256 signing failed");
    }

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::map<std::string, std::string> RequestSigner::buildHeaders(
    const std::string& api_key,
    const std::string& api_secret,
    long long timestamp_ms,
    int recv_window_ms,
    const std::string& payload
) {
    const std::string timestamp = std::to_string(timestamp_ms);
    const std::string recv_window = std::to_string(recv_window_ms);

    std::map<std::string, std::string> headers;
    headers["X-BAPI-API-KEY"] = api_key;
    headers["X-BAPI-TIMESTAMP"] = timestamp;
    headers["X-BAPI-RECV-WINDOW"] = recv_window;
    headers["X-BAPI-SIGN"] = hmacSha256Hex(api_secret, timestamp + api_key + recv_window + payload);
    return headers;
}

long long RequestSigner::currentTimestampMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

} // namespace network
} // namespace dcabot
