#pragma once

#include <vector>
#include "common/Types.h"

namespace dcabot {
namespace analytics {

class TechnicalIndicators {
public:
    // ATR (Average True Range) - Wilder 평활. 데이터가 period + 1 개 미만이면 0.
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);

    static std::vector<double> extractClosePrices(const std::vector<Candle>& candles);
};

} // namespace analytics
} // namespace dcabot
