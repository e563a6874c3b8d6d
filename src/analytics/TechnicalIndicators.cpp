#include "analytics/TechnicalIndicators.h"

#include <algorithm>
#include <cmath>

namespace dcabot {
namespace analytics {

double TechnicalIndicators::calculateATR(const std::vector<Candle>& candles, int period) {
    if (period <= 0 || candles.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    // 첫 TR 은 0번째와 1번째 사이에서 발생
    std::vector<double> tr_values;
    tr_values.reserve(candles.size());
    for (size_t i = 1; i < candles.size(); ++i) {
        const auto& current = candles[i];
        const auto& prev = candles[i - 1];

        double tr1 = current.high - current.low;
        double tr2 = std::abs(current.high - prev.close);
        double tr3 = std::abs(current.low - prev.close);

        tr_values.push_back(std::max({tr1, tr2, tr3}));
    }

    // 초기 ATR (첫 period 개의 평균)
    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }

    return atr;
}

std::vector<double> TechnicalIndicators::extractClosePrices(const std::vector<Candle>& candles) {
    std::vector<double> closes;
    closes.reserve(candles.size());
    for (const auto& c : candles) {
        closes.push_back(c.close);
    }
    return closes;
}

} // namespace analytics
} // namespace dcabot
