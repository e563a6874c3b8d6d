#include "common/IntervalClock.h"

#include <algorithm>
#include <cctype>

namespace dcabot {
namespace common {

namespace {
bool isDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}
}

std::string normalizeInterval(const std::string& interval) {
    if (interval == "D" || interval == "W" || interval == "M") {
        return interval;
    }

    std::string lower = interval;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1d" || lower == "d") return "D";

    if (lower.size() > 1) {
        const char unit = lower.back();
        const std::string number = lower.substr(0, lower.size() - 1);
        if (isDigits(number)) {
            if (unit == 'm') return std::to_string(std::stoi(number));
            if (unit == 'h') return std::to_string(std::stoi(number) * 60);
        }
    }
    return lower;
}

bool isSupportedInterval(const std::string& interval) {
    const std::string n = normalizeInterval(interval);
    if (n == "D") return true;
    return isDigits(n) && std::stoi(n) > 0;
}

std::chrono::seconds intervalDuration(const std::string& interval) {
    const std::string n = normalizeInterval(interval);
    if (n == "D") return std::chrono::hours(24);
    if (isDigits(n)) {
        const int minutes = std::stoi(n);
        if (minutes > 0) return std::chrono::minutes(minutes);
    }
    return std::chrono::minutes(5);
}

std::chrono::milliseconds timeUntilNextBoundary(
    const std::string& interval,
    std::chrono::system_clock::time_point now
) {
    using namespace std::chrono;
    const auto period = duration_cast<milliseconds>(intervalDuration(interval));
    const auto since_epoch = duration_cast<milliseconds>(now.time_since_epoch());
    // epoch 는 UTC 자정이므로 하루를 나누는 주기는 벽시계 경계와 일치
    const auto into_period = since_epoch % period;
    return period - into_period;
}

} // namespace common
} // namespace dcabot
