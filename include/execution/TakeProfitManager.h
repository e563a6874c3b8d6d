#pragma once

#include "common/Types.h"
#include "engine/EngineConfig.h"
#include "exchange/IVenue.h"
#include "strategy/ITakeProfitStrategy.h"

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace dcabot {
namespace execution {

struct PlacementResult {
    int placed = 0;
    int skipped = 0;            // 거래소 최소 수량/금액 미달
    int failed = 0;
    bool budget_exhausted = false;
    double take_profit_percent = 0.0;

    // 한 레그라도 걸리면 부분 성공으로 인정
    bool success() const { return placed > 0; }
};

// 포지션 전체를 덮는 N 개의 익절 지정가 매도 레그를 관리
class TakeProfitManager {
public:
    TakeProfitManager(std::shared_ptr<exchange::IVenue> venue,
                      std::string category,
                      std::string symbol,
                      const engine::TakeProfitSettings& settings,
                      std::shared_ptr<strategy::ITakeProfitStrategy> tp_strategy);

    // 기존 레그 취소 후 새로 배치
    PlacementResult placeAll(double total_quantity, double average_price,
                             const strategy::MarketContext& context = {});

    // 평균가가 바뀐 뒤 거래소 잔량 기준으로 재배치. 거래소 평균가가 우선.
    PlacementResult updateAll(double new_average_price,
                              const strategy::MarketContext& context = {});

    // 추적 중인데 미체결 목록에서 사라진 레그 = 체결. 새로 체결된 ID 반환.
    std::vector<std::string> detectFills();
    std::vector<TakeProfitLeg> drainFilledLegs();

    // 거래소 미체결 목록 기준으로 취소, 조회 실패 시에만 메모리 기준. 취소 건수 반환.
    // 하나라도 취소하지 못하면 나머지를 모두 시도한 뒤 BotError(ORDER).
    int cancelAll();

    // 시작 시 이전 실행이 남긴 익절 주문 정리
    int cancelOrphanedOrders(double average_price, double position_size);

    // 외부 청산 감지 시 추적만 비움 (주문은 거래소가 이미 정리)
    void clearTracking();

    std::vector<TakeProfitLeg> trackedLegs() const;
    std::size_t liveLegCount() const;

    static std::vector<double> distributeLegQuantities(double total_quantity,
                                                       int levels,
                                                       double level_fraction,
                                                       double min_order_qty,
                                                       double qty_step);

    static bool isTakeProfitOrder(const VenueOrder& order,
                                  const std::string& symbol,
                                  double average_price,
                                  double position_size,
                                  const engine::ClassifierSettings& classifier,
                                  const std::set<std::string>& tracked_ids);

    static constexpr double kAveragePriceEpsilon = 1e-4;

private:
    void cancelTrackedLegs(const std::vector<TakeProfitLeg>& legs);
    std::set<std::string> trackedIds() const;

    std::shared_ptr<exchange::IVenue> venue_;
    std::string category_;
    std::string symbol_;
    engine::TakeProfitSettings settings_;
    std::shared_ptr<strategy::ITakeProfitStrategy> tp_strategy_;

    mutable std::mutex mutex_;
    std::map<std::string, TakeProfitLeg> legs_;     // key: order_id
    std::vector<TakeProfitLeg> filled_;
    double last_average_price_ = 0.0;
    double last_total_quantity_ = 0.0;
};

} // namespace execution
} // namespace dcabot
