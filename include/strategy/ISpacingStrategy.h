#pragma once

#include "strategy/MarketContext.h"

#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace dcabot {
namespace strategy {

// 다음 DCA 진입에 필요한 최소 하락률 (0.03 = 평균가 대비 3% 하락)
class ISpacingStrategy {
public:
    virtual ~ISpacingStrategy() = default;

    virtual double requiredThreshold(int level, const MarketContext& context) const = 0;
    virtual std::string getName() const = 0;
};

// 고정 누진: base * multiplier^level, [min, max] 로 제한
class FixedProgressiveSpacing : public ISpacingStrategy {
public:
    explicit FixedProgressiveSpacing(const nlohmann::json& params = nlohmann::json::object());

    double requiredThreshold(int level, const MarketContext& context) const override;
    std::string getName() const override { return "fixed_progressive"; }

private:
    double base_threshold_ = 0.01;
    double threshold_multiplier_ = 1.15;
    double max_threshold_ = 0.20;
    double min_threshold_ = 0.001;
};

// ATR 기반: 변동성이 클수록 간격을 넓힌다
class VolatilityAdaptiveSpacing : public ISpacingStrategy {
public:
    explicit VolatilityAdaptiveSpacing(const nlohmann::json& params = nlohmann::json::object());

    double requiredThreshold(int level, const MarketContext& context) const override;
    std::string getName() const override { return "volatility_adaptive"; }

private:
    double applyLevelMultiplierCapped(double base, int level) const;

    double base_threshold_ = 0.01;
    double volatility_sensitivity_ = 2.0;
    int atr_period_ = 14;
    double max_threshold_ = 0.05;
    double min_threshold_ = 0.003;
    double level_multiplier_ = 1.1;
};

// "fixed" | "volatility_adaptive"
std::unique_ptr<ISpacingStrategy> createSpacingStrategy(const std::string& name,
                                                        const nlohmann::json& params);

} // namespace strategy
} // namespace dcabot
