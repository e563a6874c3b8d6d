#include "strategy/ISpacingStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "resilience/BotError.h"

#include <algorithm>
#include <cmath>

namespace dcabot {
namespace strategy {

namespace {
// 적응형 간격의 절대 상한
constexpr double kAdaptiveCeiling = 0.06;
}

FixedProgressiveSpacing::FixedProgressiveSpacing(const nlohmann::json& params) {
    base_threshold_ = params.value("base_threshold", base_threshold_);
    threshold_multiplier_ = params.value("threshold_multiplier", threshold_multiplier_);
    max_threshold_ = params.value("max_threshold", max_threshold_);
    min_threshold_ = params.value("min_threshold", min_threshold_);

    if (base_threshold_ <= 0.0 || base_threshold_ >= 1.0) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   "invalid base_threshold for fixed spacing");
    }
    if (threshold_multiplier_ < 1.0 || threshold_multiplier_ > 5.0) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   "invalid threshold_multiplier for fixed spacing");
    }
}

double FixedProgressiveSpacing::requiredThreshold(int level, const MarketContext&) const {
    double threshold = base_threshold_;
    if (threshold_multiplier_ > 1.0 && level > 0) {
        threshold *= std::pow(threshold_multiplier_, level);
    }
    return std::clamp(threshold, min_threshold_, max_threshold_);
}

VolatilityAdaptiveSpacing::VolatilityAdaptiveSpacing(const nlohmann::json& params) {
    base_threshold_ = params.value("base_threshold", base_threshold_);
    volatility_sensitivity_ = params.value("volatility_sensitivity", volatility_sensitivity_);
    atr_period_ = params.value("atr_period", atr_period_);
    max_threshold_ = params.value("max_threshold", max_threshold_);
    min_threshold_ = params.value("min_threshold", min_threshold_);
    level_multiplier_ = params.value("level_multiplier", level_multiplier_);

    if (base_threshold_ <= 0.0 || atr_period_ < 1 || min_threshold_ > max_threshold_) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   "invalid parameters for volatility_adaptive spacing");
    }
}

double VolatilityAdaptiveSpacing::requiredThreshold(int level, const MarketContext& context) const {
    const double atr = analytics::TechnicalIndicators::calculateATR(context.candles, atr_period_);

    if (atr <= 0.0 || context.current_price <= 0.0) {
        if (level_multiplier_ <= 1.0 || level == 0) {
            return base_threshold_;
        }
        return base_threshold_ * std::pow(level_multiplier_, level);
    }

    // 정규화 변동성 0.5% -> base * 0.51, 3% -> base * 0.56 (sensitivity 2)
    const double normalized = atr / context.current_price;
    const double adaptive_base = base_threshold_ * (0.5 + normalized * volatility_sensitivity_);

    double threshold = applyLevelMultiplierCapped(adaptive_base, level);
    threshold = std::max(threshold, min_threshold_);
    threshold = std::min(threshold, std::min(max_threshold_, kAdaptiveCeiling));
    return threshold;
}

double VolatilityAdaptiveSpacing::applyLevelMultiplierCapped(double base, int level) const {
    if (level_multiplier_ <= 1.0 || level == 0) {
        return base;
    }
    if (level <= 3) {
        return base * std::pow(level_multiplier_, level);
    }
    // 4 레벨부터는 선형 증가 (레벨 3 값의 15% 씩)
    const double level3 = base * std::pow(level_multiplier_, 3.0);
    return level3 + static_cast<double>(level - 3) * level3 * 0.15;
}

std::unique_ptr<ISpacingStrategy> createSpacingStrategy(const std::string& name,
                                                        const nlohmann::json& params) {
    if (name == "fixed" || name == "fixed_progressive") {
        return std::make_unique<FixedProgressiveSpacing>(params);
    }
    if (name == "volatility_adaptive") {
        return std::make_unique<VolatilityAdaptiveSpacing>(params);
    }
    throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                               "invalid spacing strategy: " + name);
}

} // namespace strategy
} // namespace dcabot
