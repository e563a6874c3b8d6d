#include "strategy/ITakeProfitStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "resilience/BotError.h"

#include <algorithm>

namespace dcabot {
namespace strategy {

VolatilityTakeProfit::VolatilityTakeProfit(const engine::DynamicTakeProfitSettings& settings)
    : settings_(settings) {
    if (settings_.min_percent <= 0.0 || settings_.min_percent > settings_.max_percent) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   "invalid dynamic take-profit band");
    }
    if (settings_.atr_period < 1) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   "invalid dynamic take-profit atr_period");
    }
}

double VolatilityTakeProfit::takeProfitPercent(const MarketContext& context) const {
    const double atr = analytics::TechnicalIndicators::calculateATR(context.candles,
                                                                    settings_.atr_period);
    if (atr <= 0.0 || context.current_price <= 0.0) {
        return settings_.base_percent;
    }

    const double percent = settings_.base_percent +
                           settings_.multiplier * (atr / context.current_price);
    return std::clamp(percent, settings_.min_percent, settings_.max_percent);
}

std::unique_ptr<ITakeProfitStrategy> createTakeProfitStrategy(
    const engine::TakeProfitSettings& take_profit,
    const engine::DynamicTakeProfitSettings& dynamic_tp) {
    if (!dynamic_tp.enabled) {
        return std::make_unique<FixedTakeProfit>(take_profit.base_percent);
    }
    if (dynamic_tp.strategy == "fixed") {
        return std::make_unique<FixedTakeProfit>(dynamic_tp.base_percent);
    }
    if (dynamic_tp.strategy == "volatility") {
        return std::make_unique<VolatilityTakeProfit>(dynamic_tp);
    }
    throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                               "invalid dynamic take-profit strategy: " + dynamic_tp.strategy);
}

} // namespace strategy
} // namespace dcabot
