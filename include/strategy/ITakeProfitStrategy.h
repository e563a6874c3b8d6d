#pragma once

#include "engine/EngineConfig.h"
#include "strategy/MarketContext.h"

#include <memory>
#include <string>

namespace dcabot {
namespace strategy {

// 평균가 대비 전체 익절 폭 (0.02 = +2%). 레그 i 는 이 값의 i/N 을 쓴다.
class ITakeProfitStrategy {
public:
    virtual ~ITakeProfitStrategy() = default;

    virtual double takeProfitPercent(const MarketContext& context) const = 0;
    virtual std::string getName() const = 0;
};

class FixedTakeProfit : public ITakeProfitStrategy {
public:
    explicit FixedTakeProfit(double base_percent) : base_percent_(base_percent) {}

    double takeProfitPercent(const MarketContext&) const override { return base_percent_; }
    std::string getName() const override { return "fixed"; }

private:
    double base_percent_;
};

// base + multiplier * ATR/price, [min_percent, max_percent] 로 제한
class VolatilityTakeProfit : public ITakeProfitStrategy {
public:
    explicit VolatilityTakeProfit(const engine::DynamicTakeProfitSettings& settings);

    double takeProfitPercent(const MarketContext& context) const override;
    std::string getName() const override { return "volatility"; }

private:
    engine::DynamicTakeProfitSettings settings_;
};

// dynamic_tp.enabled 이면 동적 전략, 아니면 take_profit.base_percent 고정
std::unique_ptr<ITakeProfitStrategy> createTakeProfitStrategy(
    const engine::TakeProfitSettings& take_profit,
    const engine::DynamicTakeProfitSettings& dynamic_tp);

} // namespace strategy
} // namespace dcabot
