#pragma once
// ===================================================================
// 거래소 수치 헬퍼
//
// 거래소는 수량/가격을 10진 문자열로 주고받는다. 수량은 qty_step,
// 가격은 tick_size 의 배수여야 하며 어긋나면 주문이 거부된다.
// ===================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace dcabot {
namespace common {

// 부동소수 오차로 0.2999999 가 0.299 로 내려가는 것을 막는 여유
constexpr double kStepEpsilon = 1e-9;

inline std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

// 빈 문자열, 공백, "null"/"undefined"/"NaN" 은 거부
inline double parseDecimal(const std::string& raw, const std::string& field) {
    if (raw.empty()) {
        throw std::invalid_argument(field + " is empty string");
    }
    const std::string s = trimCopy(raw);
    if (s.empty()) {
        throw std::invalid_argument(field + " contains only whitespace");
    }
    if (s == "null" || s == "undefined" || s == "NaN") {
        throw std::invalid_argument(field + " has invalid numeric value: " + s);
    }

    char* end = nullptr;
    const double value = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0' || !std::isfinite(value)) {
        throw std::invalid_argument(field + " parse error: " + s);
    }
    return value;
}

inline std::optional<double> tryParseDecimal(const std::string& raw) {
    try {
        return parseDecimal(raw, "value");
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

// step 의 소수점 자릿수 (0.001 -> 3)
inline int stepDecimals(double step) {
    if (step <= 0.0) return 8;
    int decimals = 0;
    double t = step;
    while (decimals < 10 && std::fabs(t - std::round(t)) > kStepEpsilon) {
        t *= 10.0;
        decimals++;
    }
    return decimals;
}

inline double normalizeToStep(double value, double step) {
    const double scale = std::pow(10.0, stepDecimals(step));
    return std::round(value * scale) / scale;
}

// 매도 수량용: step 단위 내림
inline double roundDownToStep(double value, double step) {
    if (step <= 0.0) return value;
    return normalizeToStep(std::floor(value / step + kStepEpsilon) * step, step);
}

// 매수 수량용: 가장 가까운 step
inline double roundToStep(double value, double step) {
    if (step <= 0.0) return value;
    return normalizeToStep(std::round(value / step) * step, step);
}

inline double roundToTick(double price, double tick) {
    if (tick <= 0.0) return price;
    return normalizeToStep(std::round(price / tick) * tick, tick);
}

// 주문 전송용 문자열 ("0.203", "64250.5")
inline std::string formatDecimal(double value, double step) {
    const int decimals = step > 0.0 ? stepDecimals(step) : 8;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return std::string(buf);
}

} // namespace common
} // namespace dcabot
