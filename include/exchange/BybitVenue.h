#pragma once

#include "exchange/IVenue.h"
#include "engine/EngineConfig.h"
#include "network/IHttpClient.h"

#include <map>
#include <memory>
#include <mutex>

namespace dcabot {
namespace exchange {

class BybitVenue : public IVenue {
public:
    explicit BybitVenue(std::shared_ptr<network::IHttpClient> http_client);

    static std::string baseUrlFor(engine::VenueEnvironment environment);

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
    // 시장가 주문은 생성 응답에 체결 정보가 없어서 한 번 더 조회
    void fillExecutionDetails(const OrderRequest& request, OrderResult& result);

    std::shared_ptr<network::IHttpClient> http_client_;
    std::map<std::string, TradingConstraints> constraints_cache_;
    std::mutex cache_mutex_;
};

} // namespace exchange
} // namespace dcabot
