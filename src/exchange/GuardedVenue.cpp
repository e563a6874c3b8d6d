#include "exchange/GuardedVenue.h"
#include "common/Logger.h"
#include "resilience/BotError.h"

namespace dcabot {
namespace exchange {

using resilience::BotError;
using resilience::ErrorCategory;

GuardedVenue::GuardedVenue(std::shared_ptr<IVenue> inner,
                           const engine::ResilienceSettings& settings,
                           std::shared_ptr<resilience::RateLimiterRegistry> limiters,
                           std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
                           std::shared_ptr<common::StopSignal> stop_signal,
                           std::shared_ptr<common::StopSignal> cleanup_signal)
    : inner_(std::move(inner))
    , stop_signal_(std::move(stop_signal))
    , cleanup_signal_(std::move(cleanup_signal))
{
    auto guard_for = [&](const char* name) {
        engine::OperationClassSettings cls;
        auto it = settings.classes.find(name);
        if (it != settings.classes.end()) {
            cls = it->second;
        }
        Guard guard;
        guard.limiter = limiters->getOrCreate(name, cls.capacity, cls.refill_per_second);
        guard.breaker = breakers->getOrCreate(name, cls.breaker);
        return guard;
    };

    trading_ = guard_for(kTradingClass);
    market_data_ = guard_for(kMarketDataClass);
    account_data_ = guard_for(kAccountDataClass);
}

template<typename Fn>
auto GuardedVenue::guarded(const Guard& guard, const char* operation, Fn fn) -> decltype(fn()) {
    // 정지 후에는 정리 호출이 보충을 기다려야 한다. 정리 시한이 지나면 cleanup_signal 이 끊는다.
    const common::StopSignal* cancel = stop_signal_.get();
    if (cancel && cancel->stopRequested()) {
        cancel = cleanup_signal_.get();
    }
    if (!guard.limiter->waitN(cancel, 1)) {
        throw resilience::OperationCancelled(operation);
    }

    try {
        return guard.breaker->execute(fn);
    } catch (const BotError& e) {
        if (e.category() == ErrorCategory::RATE_LIMIT) {
            guard.limiter->drain();
        }
        throw;
    }
}

void GuardedVenue::connect() {
    guarded(market_data_, "connect", [&]() { inner_->connect(); return true; });
}

void GuardedVenue::disconnect() {
    // 종료 경로: 버킷/차단기를 거치지 않음
    inner_->disconnect();
}

std::vector<VenuePosition> GuardedVenue::getPositions(
    const std::string& category, const std::string& symbol
) {
    return guarded(account_data_, "getPositions",
                   [&]() { return inner_->getPositions(category, symbol); });
}

std::vector<VenueOrder> GuardedVenue::getOpenOrders(
    const std::string& category, const std::string& symbol
) {
    return guarded(account_data_, "getOpenOrders",
                   [&]() { return inner_->getOpenOrders(category, symbol); });
}

OrderResult GuardedVenue::placeOrder(const OrderRequest& request) {
    return guarded(trading_, "placeOrder", [&]() { return inner_->placeOrder(request); });
}

void GuardedVenue::cancelOrder(const std::string& category, const std::string& symbol,
                               const std::string& order_id) {
    guarded(trading_, "cancelOrder",
            [&]() { inner_->cancelOrder(category, symbol, order_id); return true; });
}

double GuardedVenue::getLatestPrice(const std::string& category, const std::string& symbol) {
    return guarded(market_data_, "getLatestPrice",
                   [&]() { return inner_->getLatestPrice(category, symbol); });
}

TradingConstraints GuardedVenue::getTradingConstraints(
    const std::string& category, const std::string& symbol
) {
    return guarded(market_data_, "getTradingConstraints",
                   [&]() { return inner_->getTradingConstraints(category, symbol); });
}

std::vector<Candle> GuardedVenue::getKlines(const std::string& category, const std::string& symbol,
                                            const std::string& interval, int limit) {
    return guarded(market_data_, "getKlines",
                   [&]() { return inner_->getKlines(category, symbol, interval, limit); });
}

double GuardedVenue::getTradableBalance(const std::string& coin) {
    return guarded(account_data_, "getTradableBalance",
                   [&]() { return inner_->getTradableBalance(coin); });
}

} // namespace exchange
} // namespace dcabot
