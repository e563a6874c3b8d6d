#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"

#include <string>

namespace dcabot {
namespace risk {

struct EntryPlan {
    bool valid = false;
    double amount = 0.0;          // USDT 명목가
    double quantity = 0.0;
    std::string quantity_text;    // 수량 단위 자리수로 포맷
    double required_margin = 0.0;
    std::string reason;
};

class EntrySizer {
public:
    explicit EntrySizer(const engine::StrategySettings& settings);

    // base * min(1 + level * 0.5, max_multiplier)
    double entryAmount(int dca_level) const;

    EntryPlan plan(int dca_level, double price, double balance,
                   const TradingConstraints& constraints) const;

private:
    engine::StrategySettings settings_;
};

} // namespace risk
} // namespace dcabot
