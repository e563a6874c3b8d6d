#pragma once

#include "common/StopSignal.h"
#include "engine/EngineConfig.h"
#include "exchange/IVenue.h"
#include "resilience/CircuitBreaker.h"
#include "resilience/RateLimiter.h"

#include <memory>
#include <string>

namespace dcabot {
namespace exchange {

// 작업 분류
constexpr const char* kTradingClass = "trading";
constexpr const char* kMarketDataClass = "market_data";
constexpr const char* kAccountDataClass = "account_data";

// 모든 거래소 호출을 분류별 토큰 버킷 + 차단기 뒤로 보내는 데코레이터.
// stop_signal 이 닫힌 뒤(종료 정리)에는 토큰 대기를 cleanup_signal 이 닫힐 때까지 계속한다.
class GuardedVenue : public IVenue {
public:
    GuardedVenue(std::shared_ptr<IVenue> inner,
                 const engine::ResilienceSettings& settings,
                 std::shared_ptr<resilience::RateLimiterRegistry> limiters,
                 std::shared_ptr<resilience::CircuitBreakerRegistry> breakers,
                 std::shared_ptr<common::StopSignal> stop_signal,
                 std::shared_ptr<common::StopSignal> cleanup_signal = nullptr);

    void connect() override;
    void disconnect() override;

    std::vector<VenuePosition> getPositions(
        const std::string& category, const std::string& symbol) override;
    std::vector<VenueOrder> getOpenOrders(
        const std::string& category, const std::string& symbol) override;
    OrderResult placeOrder(const OrderRequest& request) override;
    void cancelOrder(const std::string& category, const std::string& symbol,
                     const std::string& order_id) override;
    double getLatestPrice(const std::string& category, const std::string& symbol) override;
    TradingConstraints getTradingConstraints(
        const std::string& category, const std::string& symbol) override;
    std::vector<Candle> getKlines(const std::string& category, const std::string& symbol,
                                  const std::string& interval, int limit) override;
    double getTradableBalance(const std::string& coin) override;

private:
    struct Guard {
        std::shared_ptr<resilience::RateLimiter> limiter;
        std::shared_ptr<resilience::CircuitBreaker> breaker;
    };

    template<typename Fn>
    auto guarded(const Guard& guard, const char* operation, Fn fn) -> decltype(fn());

    std::shared_ptr<IVenue> inner_;
    std::shared_ptr<common::StopSignal> stop_signal_;
    std::shared_ptr<common::StopSignal> cleanup_signal_;
    Guard trading_;
    Guard market_data_;
    Guard account_data_;
};

} // namespace exchange
} // namespace dcabot
