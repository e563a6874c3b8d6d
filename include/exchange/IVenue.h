#pragma once

#include "common/Types.h"

#include <string>
#include <vector>

namespace dcabot {
namespace exchange {

// 거래소 계약. 모든 호출은 실패 시 resilience::BotError 를 던진다.
class IVenue {
public:
    virtual ~IVenue() = default;

    virtual void connect() = 0;
    virtual void disconnect() = 0;

    virtual std::vector<VenuePosition> getPositions(
        const std::string& category, const std::string& symbol) = 0;

    virtual std::vector<VenueOrder> getOpenOrders(
        const std::string& category, const std::string& symbol) = 0;

    virtual OrderResult placeOrder(const OrderRequest& request) = 0;

    // 이미 없는 주문 취소는 성공으로 취급
    virtual void cancelOrder(const std::string& category, const std::string& symbol,
                             const std::string& order_id) = 0;

    virtual double getLatestPrice(const std::string& category, const std::string& symbol) = 0;

    virtual TradingConstraints getTradingConstraints(
        const std::string& category, const std::string& symbol) = 0;

    // 오래된 캔들부터
    virtual std::vector<Candle> getKlines(const std::string& category, const std::string& symbol,
                                          const std::string& interval, int limit) = 0;

    virtual double getTradableBalance(const std::string& coin) = 0;
};

} // namespace exchange
} // namespace dcabot
