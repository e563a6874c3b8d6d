#pragma once

#include "common/Types.h"

#include <vector>

namespace dcabot {
namespace strategy {

// 전략 함수에 넘기는 시점 스냅샷
struct MarketContext {
    double current_price = 0.0;
    double average_price = 0.0;
    double last_entry_price = 0.0;
    std::vector<double> price_history;
    std::vector<Candle> candles;
};

} // namespace strategy
} // namespace dcabot
