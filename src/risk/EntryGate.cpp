#include "risk/EntryGate.h"
#include "resilience/BotError.h"

#include <cmath>
#include <sstream>
#include <string>

namespace dcabot {
namespace risk {

EntryGate::EntryGate(std::shared_ptr<strategy::ISpacingStrategy> spacing)
    : spacing_(std::move(spacing)) {
    if (!spacing_) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   "entry gate requires a spacing strategy");
    }
}

EntryDecision EntryGate::evaluate(int dca_level,
                                  double average_price,
                                  double current_price,
                                  const strategy::MarketContext& context) const {
    EntryDecision decision;

    // 첫 진입은 비교할 평균가가 없다
    if (dca_level == 0) {
        decision.allowed = true;
        decision.reason = "first entry";
        return decision;
    }

    // 진입 이후 포지션 동기화가 실패하면 평균가가 비어 있을 수 있다
    if (average_price <= 0.0 || !std::isfinite(average_price)) {
        decision.reason = "blocked: unknown average price (level " + std::to_string(dca_level) + ")";
        return decision;
    }

    if (current_price <= 0.0 || !std::isfinite(current_price)) {
        decision.reason = "invalid current price";
        return decision;
    }

    decision.required_threshold = spacing_->requiredThreshold(dca_level, context);
    decision.price_change = (average_price - current_price) / average_price;

    std::ostringstream oss;
    oss << "price change " << decision.price_change * 100.0 << "% vs required "
        << decision.required_threshold * 100.0 << "% (" << spacing_->getName()
        << ", level " << dca_level << ")";

    decision.allowed = decision.price_change >= decision.required_threshold;
    decision.reason = (decision.allowed ? "allowed: " : "blocked: ") + oss.str();
    return decision;
}

} // namespace risk
} // namespace dcabot
