#pragma once

#include <chrono>
#include <string>

namespace dcabot {
namespace common {

// "5m" -> "5", "1h" -> "60", "4h" -> "240", "1d" -> "D". 숫자 형식은 그대로.
std::string normalizeInterval(const std::string& interval);

// 정규화 결과가 캔들 주기로 해석 가능한지
bool isSupportedInterval(const std::string& interval);

// 알 수 없는 형식이면 5분
std::chrono::seconds intervalDuration(const std::string& interval);

// now 이후 가장 가까운 UTC 정렬 경계까지 남은 시간 (경계 위에 있으면 한 주기 전체)
std::chrono::milliseconds timeUntilNextBoundary(
    const std::string& interval,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now()
);

} // namespace common
} // namespace dcabot
