#pragma once

#include "strategy/ISpacingStrategy.h"

#include <memory>
#include <string>
#include <vector>

namespace dcabot {
namespace risk {

struct EntryDecision {
    bool allowed = false;
    double price_change = 0.0;        // (avg - cur) / avg, 양수 = 하락
    double required_threshold = 0.0;
    std::string reason;
};

// 추가 진입 간격 게이트. 상위 매수 신호보다 우선한다.
class EntryGate {
public:
    explicit EntryGate(std::shared_ptr<strategy::ISpacingStrategy> spacing);

    EntryDecision evaluate(int dca_level,
                           double average_price,
                           double current_price,
                           const strategy::MarketContext& context) const;

    const strategy::ISpacingStrategy& spacing() const { return *spacing_; }

private:
    std::shared_ptr<strategy::ISpacingStrategy> spacing_;
};

} // namespace risk
} // namespace dcabot
