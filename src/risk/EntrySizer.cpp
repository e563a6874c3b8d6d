#include "risk/EntrySizer.h"
#include "common/NumberUtils.h"

#include <algorithm>

namespace dcabot {
namespace risk {

EntrySizer::EntrySizer(const engine::StrategySettings& settings)
    : settings_(settings) {}

double EntrySizer::entryAmount(int dca_level) const {
    if (dca_level <= 0) {
        return settings_.base_amount;
    }
    const double multiplier = std::min(1.0 + static_cast<double>(dca_level) * 0.5,
                                       settings_.max_multiplier);
    return settings_.base_amount * multiplier;
}

EntryPlan EntrySizer::plan(int dca_level, double price, double balance,
                           const TradingConstraints& constraints) const {
    EntryPlan result;

    if (dca_level >= settings_.max_dca_levels) {
        result.reason = "max DCA levels reached";
        return result;
    }
    if (price <= 0.0) {
        result.reason = "invalid price";
        return result;
    }

    result.amount = entryAmount(dca_level);

    const double step = constraints.qty_step > 0.0 ? constraints.qty_step : 0.001;
    double quantity = common::roundToStep(result.amount / price, step);
    if (quantity < step) {
        quantity = step;
    }
    if (constraints.min_order_qty > 0.0 && quantity < constraints.min_order_qty) {
        quantity = common::roundToStep(constraints.min_order_qty, step);
        if (quantity < constraints.min_order_qty) {
            quantity += step;
        }
    }
    if (constraints.max_order_qty > 0.0 && quantity > constraints.max_order_qty) {
        result.reason = "quantity above venue maximum";
        return result;
    }

    const double notional = quantity * price;
    if (constraints.min_order_value > 0.0 && notional < constraints.min_order_value) {
        result.reason = "notional below venue minimum";
        return result;
    }

    const double leverage = settings_.leverage_assumption > 0.0 ? settings_.leverage_assumption : 1.0;
    result.required_margin = notional / leverage;
    if (result.required_margin > balance) {
        result.reason = "insufficient balance";
        return result;
    }

    result.quantity = quantity;
    result.quantity_text = common::formatDecimal(quantity, step);
    result.valid = true;
    return result;
}

} // namespace risk
} // namespace dcabot
