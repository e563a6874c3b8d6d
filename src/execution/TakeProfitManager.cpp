#include "execution/TakeProfitManager.h"
#include "common/Logger.h"
#include "common/NumberUtils.h"
#include "resilience/BotError.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iterator>

namespace dcabot {
namespace execution {

TakeProfitManager::TakeProfitManager(std::shared_ptr<exchange::IVenue> venue,
                                     std::string category,
                                     std::string symbol,
                                     const engine::TakeProfitSettings& settings,
                                     std::shared_ptr<strategy::ITakeProfitStrategy> tp_strategy)
    : venue_(std::move(venue))
    , category_(std::move(category))
    , symbol_(std::move(symbol))
    , settings_(settings)
    , tp_strategy_(std::move(tp_strategy)) {
    if (settings_.levels < 1) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   "take-profit levels must be >= 1");
    }
    if (!tp_strategy_) {
        tp_strategy_ = std::make_shared<strategy::FixedTakeProfit>(settings_.base_percent);
    }
}

std::vector<double> TakeProfitManager::distributeLegQuantities(double total_quantity,
                                                               int levels,
                                                               double level_fraction,
                                                               double min_order_qty,
                                                               double qty_step) {
    std::vector<double> quantities;
    if (total_quantity <= 0.0 || levels < 1) {
        return quantities;
    }

    // 레그 비율 합이 1 을 넘지 않도록
    const double fraction = std::min(level_fraction, 1.0 / static_cast<double>(levels));

    double base = total_quantity * fraction;
    if (base < min_order_qty) {
        base = min_order_qty;
    }
    base = common::roundDownToStep(base, qty_step);

    const double funded_total = base * static_cast<double>(levels);
    if (base > 0.0 && funded_total <= total_quantity + common::kStepEpsilon) {
        quantities.assign(static_cast<std::size_t>(levels), base);
        // 남는 수량은 마지막 레그로
        const double leftover = total_quantity - funded_total;
        if (leftover > 0.0) {
            quantities.back() = common::roundDownToStep(base + leftover, qty_step);
        }
        return quantities;
    }

    // 수량이 부족하면 최소 수량 레그를 가능한 만큼만
    const double min_leg = std::max(min_order_qty, qty_step);
    if (min_leg <= 0.0) {
        return quantities;
    }
    int funded = static_cast<int>(std::floor(total_quantity / min_leg + common::kStepEpsilon));
    funded = std::min(funded, levels);
    if (funded <= 0) {
        return quantities;
    }

    const double remainder = total_quantity - min_leg * static_cast<double>(funded);
    const double share = remainder > 0.0 ? remainder / static_cast<double>(funded) : 0.0;
    for (int i = 0; i < funded; ++i) {
        quantities.push_back(common::roundDownToStep(min_leg + share, qty_step));
    }
    return quantities;
}

bool TakeProfitManager::isTakeProfitOrder(const VenueOrder& order,
                                          const std::string& symbol,
                                          double average_price,
                                          double position_size,
                                          const engine::ClassifierSettings& classifier,
                                          const std::set<std::string>& tracked_ids) {
    if (order.side != OrderSide::SELL || order.type != OrderType::LIMIT) {
        return false;
    }
    if (order.symbol != symbol) {
        return false;
    }

    // 평균가를 모르면 직접 건 주문만 신뢰
    if (average_price <= 0.0) {
        return tracked_ids.count(order.order_id) > 0;
    }

    const auto price = common::tryParseDecimal(order.price);
    if (!price || *price <= 0.0) {
        return false;
    }

    const double min_price = average_price * (1.0 + classifier.min_profit);
    const double max_price = average_price * (1.0 + classifier.max_profit);
    if (*price <= min_price || *price >= max_price) {
        return false;
    }

    // 전량 청산 주문은 제외
    if (position_size > 0.0) {
        const auto quantity = common::tryParseDecimal(order.quantity);
        if (!quantity || *quantity > position_size * classifier.max_position_share + common::kStepEpsilon) {
            return false;
        }
    }
    return true;
}

PlacementResult TakeProfitManager::placeAll(double total_quantity, double average_price,
                                            const strategy::MarketContext& context) {
    using Clock = std::chrono::steady_clock;
    const auto started = Clock::now();
    const auto budget = std::chrono::seconds(settings_.placement_budget_seconds);
    const auto margin = std::chrono::seconds(settings_.safety_margin_seconds);

    PlacementResult result;

    // 1. 기존 레그 취소 후 추적 목록을 먼저 비운다
    std::vector<TakeProfitLeg> previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& kv : legs_) {
            previous.push_back(kv.second);
        }
        legs_.clear();
        last_average_price_ = average_price;
        last_total_quantity_ = total_quantity;
    }
    cancelTrackedLegs(previous);

    if (total_quantity <= 0.0 || average_price <= 0.0) {
        LOG_WARN("Skip take-profit placement: quantity {} avg {}", total_quantity, average_price);
        return result;
    }

    const TradingConstraints constraints = venue_->getTradingConstraints(category_, symbol_);
    const double step = constraints.qty_step > 0.0 ? constraints.qty_step : 0.001;

    // 2. 레그별 수량
    const auto quantities = distributeLegQuantities(total_quantity, settings_.levels,
                                                    settings_.level_fraction,
                                                    constraints.min_order_qty, step);
    if (quantities.empty()) {
        LOG_WARN("Position {} too small for any take-profit leg (min qty {})",
                 total_quantity, constraints.min_order_qty);
        result.skipped = settings_.levels;
        return result;
    }

    strategy::MarketContext tp_context = context;
    tp_context.average_price = average_price;
    result.take_profit_percent = tp_strategy_->takeProfitPercent(tp_context);

    // 3. 레그 i 의 목표가 = avg * (1 + tp * i/N)
    const int levels = settings_.levels;
    for (std::size_t i = 0; i < quantities.size(); ++i) {
        const int level = static_cast<int>(i) + 1;

        const auto remaining = budget - (Clock::now() - started);
        if (remaining < margin) {
            LOG_WARN("Take-profit placement budget exhausted after {} legs", result.placed);
            result.budget_exhausted = true;
            break;
        }

        const double quantity = quantities[i];
        const double level_percent = result.take_profit_percent *
                                     static_cast<double>(level) / static_cast<double>(levels);
        const double price = common::roundToTick(average_price * (1.0 + level_percent),
                                                 constraints.tick_size);

        if (quantity < constraints.min_order_qty ||
            (constraints.min_order_value > 0.0 && quantity * price < constraints.min_order_value)) {
            LOG_WARN("Skip TP level {}: qty {} notional {:.2f} below venue minimum",
                     level, quantity, quantity * price);
            result.skipped++;
            continue;
        }

        OrderRequest request;
        request.category = category_;
        request.symbol = symbol_;
        request.side = OrderSide::SELL;
        request.type = OrderType::LIMIT;
        request.quantity = common::formatDecimal(quantity, step);
        request.price = common::formatDecimal(price, constraints.tick_size);
        request.reduce_only = true;

        try {
            const OrderResult placed = venue_->placeOrder(request);

            TakeProfitLeg leg;
            leg.level = level;
            leg.price = price;
            leg.quantity = quantity;
            leg.order_id = placed.order_id;
            leg.status = LegStatus::PENDING;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                legs_[leg.order_id] = leg;
            }
            result.placed++;
            LOG_INFO("TP level {} placed: {} @ {} (+{:.3f}%) id={}",
                     level, request.quantity, *request.price, level_percent * 100.0, leg.order_id);
        } catch (const resilience::OperationCancelled&) {
            throw;
        } catch (const std::exception& e) {
            result.failed++;
            LOG_WARN("TP level {} placement failed: {}", level, e.what());
        }
    }

    if (result.success()) {
        LOG_INFO("Take-profit legs placed: {}/{} (skipped {}, failed {})",
                 result.placed, levels, result.skipped, result.failed);
    } else {
        LOG_ERROR("No take-profit leg placed (skipped {}, failed {})", result.skipped, result.failed);
    }
    return result;
}

PlacementResult TakeProfitManager::updateAll(double new_average_price,
                                             const strategy::MarketContext& context) {
    // 수량은 메모리가 아니라 거래소 기준 (일부 레그가 이미 체결됐을 수 있다)
    const auto positions = venue_->getPositions(category_, symbol_);

    double venue_size = 0.0;
    double venue_avg = 0.0;
    for (const auto& pos : positions) {
        if (pos.symbol != symbol_) {
            continue;
        }
        const auto size = common::tryParseDecimal(pos.size);
        const auto avg = common::tryParseDecimal(pos.avg_price);
        if (size && *size > 0.0) {
            venue_size = *size;
            venue_avg = avg ? *avg : 0.0;
            break;
        }
    }

    detectFills();

    if (venue_size <= 0.0) {
        LOG_WARN("updateAll: venue reports no open {} position, cancelling legs", symbol_);
        cancelAll();
        return PlacementResult{};
    }

    double average_price = new_average_price;
    if (venue_avg > 0.0 && std::fabs(venue_avg - new_average_price) > kAveragePriceEpsilon) {
        LOG_INFO("Using venue average price {:.4f} instead of {:.4f}", venue_avg, new_average_price);
        average_price = venue_avg;
    }

    return placeAll(venue_size, average_price, context);
}

std::vector<std::string> TakeProfitManager::detectFills() {
    if (trackedIds().empty()) {
        return {};
    }

    const auto open_orders = venue_->getOpenOrders(category_, symbol_);
    std::set<std::string> open_ids;
    for (const auto& order : open_orders) {
        open_ids.insert(order.order_id);
    }

    std::vector<std::string> newly_filled;
    std::vector<TakeProfitLeg> filled_legs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = legs_.begin(); it != legs_.end();) {
            if (open_ids.count(it->first) == 0) {
                TakeProfitLeg leg = it->second;
                leg.status = LegStatus::FILLED;
                filled_.push_back(leg);
                filled_legs.push_back(leg);
                newly_filled.push_back(it->first);
                it = legs_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& leg : filled_legs) {
        LOG_INFO("TP level {} filled: {} @ {}", leg.level, leg.quantity, leg.price);
        Logger::getInstance().logTrade(symbol_, "Sell", leg.price, leg.quantity,
                                       leg.order_id, "take_profit_" + std::to_string(leg.level));
    }
    return newly_filled;
}

std::vector<TakeProfitLeg> TakeProfitManager::drainFilledLegs() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TakeProfitLeg> out;
    out.swap(filled_);
    return out;
}

int TakeProfitManager::cancelAll() {
    double average_price = 0.0;
    double total_quantity = 0.0;
    std::vector<TakeProfitLeg> tracked;
    std::set<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        average_price = last_average_price_;
        total_quantity = last_total_quantity_;
        for (const auto& kv : legs_) {
            tracked.push_back(kv.second);
            ids.insert(kv.first);
        }
    }

    std::vector<std::string> targets;
    try {
        for (const auto& order : venue_->getOpenOrders(category_, symbol_)) {
            if (ids.count(order.order_id) > 0 ||
                isTakeProfitOrder(order, symbol_, average_price, total_quantity,
                                  settings_.classifier, ids)) {
                targets.push_back(order.order_id);
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Open order query failed, cancelling {} tracked legs from memory: {}",
                 tracked.size(), e.what());
        targets.clear();
        for (const auto& leg : tracked) {
            targets.push_back(leg.order_id);
        }
    }

    // 한 건이 실패해도 나머지는 계속 취소
    int cancelled = 0;
    std::set<std::string> failed;
    for (const auto& order_id : targets) {
        try {
            venue_->cancelOrder(category_, symbol_, order_id);
            cancelled++;
        } catch (const std::exception& e) {
            failed.insert(order_id);
            LOG_WARN("Failed to cancel TP order {}: {}", order_id, e.what());
        }
    }

    // 취소하지 못한 레그는 다음 호출이 다시 시도하도록 남긴다
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = legs_.begin(); it != legs_.end();) {
            it = failed.count(it->first) ? std::next(it) : legs_.erase(it);
        }
    }

    if (cancelled > 0) {
        LOG_INFO("Cancelled {} take-profit orders", cancelled);
    }
    if (!failed.empty()) {
        throw resilience::BotError(resilience::ErrorCategory::ORDER,
                                   std::to_string(failed.size()) + " of " +
                                   std::to_string(targets.size()) +
                                   " take-profit orders could not be cancelled");
    }
    return cancelled;
}

int TakeProfitManager::cancelOrphanedOrders(double average_price, double position_size) {
    if (!settings_.cancel_orphaned_orders) {
        return 0;
    }

    const auto open_orders = venue_->getOpenOrders(category_, symbol_);
    const std::set<std::string> ids = trackedIds();

    int cancelled = 0;
    for (const auto& order : open_orders) {
        if (ids.count(order.order_id) > 0) {
            continue;
        }
        // 포지션이 없으면 남은 매도 지정가는 모두 고아
        const bool orphan = position_size <= 0.0
            ? (order.side == OrderSide::SELL && order.type == OrderType::LIMIT && order.symbol == symbol_)
            : isTakeProfitOrder(order, symbol_, average_price, position_size, settings_.classifier, ids);
        if (!orphan) {
            continue;
        }
        try {
            venue_->cancelOrder(category_, symbol_, order.order_id);
            cancelled++;
            LOG_INFO("Cancelled orphaned TP order {} ({} @ {})", order.order_id, order.quantity, order.price);
        } catch (const resilience::OperationCancelled&) {
            throw;
        } catch (const std::exception& e) {
            LOG_WARN("Failed to cancel orphaned order {}: {}", order.order_id, e.what());
        }
    }
    return cancelled;
}

void TakeProfitManager::clearTracking() {
    std::lock_guard<std::mutex> lock(mutex_);
    legs_.clear();
    last_average_price_ = 0.0;
    last_total_quantity_ = 0.0;
}

std::vector<TakeProfitLeg> TakeProfitManager::trackedLegs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TakeProfitLeg> out;
    for (const auto& kv : legs_) {
        out.push_back(kv.second);
    }
    std::sort(out.begin(), out.end(),
              [](const TakeProfitLeg& a, const TakeProfitLeg& b) { return a.level < b.level; });
    return out;
}

std::size_t TakeProfitManager::liveLegCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return legs_.size();
}

void TakeProfitManager::cancelTrackedLegs(const std::vector<TakeProfitLeg>& legs) {
    for (const auto& leg : legs) {
        try {
            venue_->cancelOrder(category_, symbol_, leg.order_id);
        } catch (const resilience::OperationCancelled&) {
            throw;
        } catch (const std::exception& e) {
            LOG_WARN("Failed to cancel previous TP level {} ({}): {}", leg.level, leg.order_id, e.what());
        }
    }
}

std::set<std::string> TakeProfitManager::trackedIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> ids;
    for (const auto& kv : legs_) {
        ids.insert(kv.first);
    }
    return ids;
}

} // namespace execution
} // namespace dcabot
