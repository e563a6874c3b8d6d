#include "FakeVenue.h"
#include "execution/TakeProfitManager.h"
#include "resilience/BotError.h"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <set>

using namespace dcabot;
using dcabot::testing::FakeVenue;
using execution::TakeProfitManager;

namespace {
bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

VenueOrder makeOrder(const std::string& id, OrderSide side, OrderType type,
                     const std::string& price, const std::string& qty,
                     const std::string& symbol = "BTCUSDT") {
    VenueOrder order;
    order.order_id = id;
    order.symbol = symbol;
    order.side = side;
    order.type = type;
    order.price = price;
    order.quantity = qty;
    return order;
}

std::unique_ptr<TakeProfitManager> makeManager(const std::shared_ptr<FakeVenue>& venue,
                                               engine::TakeProfitSettings settings = {}) {
    return std::make_unique<TakeProfitManager>(
        venue, "linear", "BTCUSDT", settings,
        std::make_shared<strategy::FixedTakeProfit>(settings.base_percent));
}
}

int main() {
    const engine::ClassifierSettings classifier;
    const std::set<std::string> none;

    // 분류기: +5%, 매도 지정가, 포지션의 30% -> 익절 레그
    {
        const auto order = makeOrder("a", OrderSide::SELL, OrderType::LIMIT, "105", "0.3");
        assert(TakeProfitManager::isTakeProfitOrder(order, "BTCUSDT", 100.0, 1.0, classifier, none));
    }
    // +20% 는 상한 초과
    {
        const auto order = makeOrder("b", OrderSide::SELL, OrderType::LIMIT, "120", "0.3");
        assert(!TakeProfitManager::isTakeProfitOrder(order, "BTCUSDT", 100.0, 1.0, classifier, none));
    }
    // 매수 주문은 가격과 무관하게 제외
    {
        const auto order = makeOrder("c", OrderSide::BUY, OrderType::LIMIT, "105", "0.3");
        assert(!TakeProfitManager::isTakeProfitOrder(order, "BTCUSDT", 100.0, 1.0, classifier, none));
    }
    // 전량 청산 주문, 다른 심볼, 최소 폭 이하, 시장가
    {
        assert(!TakeProfitManager::isTakeProfitOrder(
            makeOrder("d", OrderSide::SELL, OrderType::LIMIT, "105", "1.0"),
            "BTCUSDT", 100.0, 1.0, classifier, none));
        assert(!TakeProfitManager::isTakeProfitOrder(
            makeOrder("e", OrderSide::SELL, OrderType::LIMIT, "105", "0.3", "ETHUSDT"),
            "BTCUSDT", 100.0, 1.0, classifier, none));
        assert(!TakeProfitManager::isTakeProfitOrder(
            makeOrder("f", OrderSide::SELL, OrderType::LIMIT, "100.05", "0.3"),
            "BTCUSDT", 100.0, 1.0, classifier, none));
        assert(!TakeProfitManager::isTakeProfitOrder(
            makeOrder("g", OrderSide::SELL, OrderType::MARKET, "105", "0.3"),
            "BTCUSDT", 100.0, 1.0, classifier, none));
    }
    // 평균가를 모르면 추적 중인 ID 만 신뢰
    {
        const auto order = makeOrder("tracked", OrderSide::SELL, OrderType::LIMIT, "105", "0.3");
        const std::set<std::string> tracked = {"tracked"};
        assert(TakeProfitManager::isTakeProfitOrder(order, "BTCUSDT", 0.0, 0.0, classifier, tracked));
        const auto stranger = makeOrder("stranger", OrderSide::SELL, OrderType::LIMIT, "105", "0.3");
        assert(!TakeProfitManager::isTakeProfitOrder(stranger, "BTCUSDT", 0.0, 0.0, classifier, tracked));
    }

    // 배치: 5 레그, 가격은 avg * (1 + 2% * i/5), reduce-only 매도 지정가
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(1.0, 100.0);
        auto manager = makeManager(venue);

        const auto result = manager->placeAll(1.0, 100.0);
        assert(result.success());
        assert(result.placed == 5);
        assert(result.skipped == 0 && result.failed == 0);
        assert(near(result.take_profit_percent, 0.02));

        const auto legs = manager->trackedLegs();
        assert(legs.size() == 5);
        for (std::size_t i = 0; i < legs.size(); ++i) {
            assert(legs[i].level == static_cast<int>(i) + 1);
            assert(near(legs[i].quantity, 0.2));
            assert(legs[i].status == LegStatus::PENDING);
        }
        assert(near(legs[0].price, 100.4));
        assert(near(legs[4].price, 102.0));

        for (const auto& request : venue->placedOrders()) {
            assert(request.side == OrderSide::SELL);
            assert(request.type == OrderType::LIMIT);
            assert(request.reduce_only);
            assert(request.price.has_value());
        }
        assert(*venue->placedOrders()[0].price == "100.4");
        assert(venue->placedOrders()[0].quantity == "0.200");

        // 재배치하면 이전 레그는 취소된다
        manager->placeAll(1.0, 100.0);
        assert(venue->cancelledOrders().size() == 5);
        assert(venue->openOrderCount() == 5);
        assert(manager->liveLegCount() == 5);
    }

    // 부분 성공: 일부 레그 실패는 되돌리지 않는다
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->rejectLimitOrderNumber(2);
        venue->rejectLimitOrderNumber(4);
        auto manager = makeManager(venue);

        const auto result = manager->placeAll(1.0, 100.0);
        assert(result.success());
        assert(result.placed == 3);
        assert(result.failed == 2);
        assert(manager->liveLegCount() == 3);
    }

    // 최소 금액 미달 레그는 건너뜀
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->constraints.min_order_value = 25.0;         // 레그 0.2 x ~101 = ~20
        auto manager = makeManager(venue);
        const auto result = manager->placeAll(1.0, 100.0);
        assert(!result.success());
        assert(result.skipped == 5);
        assert(manager->liveLegCount() == 0);
    }

    // 시간 예산이 여유보다 작으면 아무것도 걸지 않는다
    {
        auto venue = std::make_shared<FakeVenue>();
        engine::TakeProfitSettings settings;
        settings.placement_budget_seconds = 5;
        settings.safety_margin_seconds = 10;
        auto manager = makeManager(venue, settings);
        const auto result = manager->placeAll(1.0, 100.0);
        assert(result.budget_exhausted);
        assert(!result.success());
    }

    // 체결 감지: 미체결 목록에서 사라진 레그
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(1.0, 100.0);
        auto manager = makeManager(venue);
        manager->placeAll(1.0, 100.0);

        const auto legs = manager->trackedLegs();
        venue->fillOrder(legs[0].order_id);
        venue->fillOrder(legs[1].order_id);

        const auto filled = manager->detectFills();
        assert(filled.size() == 2);
        assert(manager->liveLegCount() == 3);
        assert(near(venue->positionSize(), 0.6));

        const auto drained = manager->drainFilledLegs();
        assert(drained.size() == 2);
        assert(drained[0].status == LegStatus::FILLED);
        assert(manager->drainFilledLegs().empty());
        assert(manager->detectFills().empty());
    }

    // 평균가 갱신: 거래소 평균가와 잔량이 우선
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(1.0, 100.0);
        auto manager = makeManager(venue);
        manager->placeAll(1.0, 100.0);

        venue->fillOrder(manager->trackedLegs()[0].order_id);     // 0.8 남음
        venue->setPosition(1.8, 95.0);                              // 추가 진입 후

        const auto result = manager->updateAll(96.0);
        assert(result.placed == 5);
        const auto legs = manager->trackedLegs();
        assert(near(legs[0].price, 95.4));                         // 95 * 1.004 = 95.38 -> 틱 0.1
        double total = 0.0;
        for (const auto& leg : legs) total += leg.quantity;
        assert(near(total, 1.8));
    }

    // 전체 취소: 거래소 기준, 두 번 불러도 오류 없음
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(1.0, 100.0);
        auto manager = makeManager(venue);
        manager->placeAll(1.0, 100.0);

        // 재시작 전에 남은 익절 주문과 무관한 손절 주문
        venue->addOpenOrder(makeOrder("old-tp", OrderSide::SELL, OrderType::LIMIT, "103", "0.2"));
        venue->addOpenOrder(makeOrder("stop", OrderSide::SELL, OrderType::LIMIT, "90", "1.0"));

        const int cancelled = manager->cancelAll();
        assert(cancelled == 6);
        assert(manager->liveLegCount() == 0);
        assert(venue->openOrderCount() == 1);

        assert(manager->cancelAll() == 0);
        assert(manager->cancelAll() == 0);
    }

    // 미체결 조회 실패 시 메모리 기준으로 취소
    {
        auto venue = std::make_shared<FakeVenue>();
        auto manager = makeManager(venue);
        manager->placeAll(1.0, 100.0);
        venue->failNext("getOpenOrders", 1);
        assert(manager->cancelAll() == 5);
        assert(venue->openOrderCount() == 0);
    }

    // 취소 실패가 있어도 나머지는 계속, 실패한 레그는 추적에 남아 재시도
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(1.0, 100.0);
        auto manager = makeManager(venue);
        manager->placeAll(1.0, 100.0);
        venue->failNext("cancelOrder", 2);

        bool thrown = false;
        try {
            manager->cancelAll();
        } catch (const resilience::BotError& e) {
            thrown = e.category() == resilience::ErrorCategory::ORDER;
        }
        assert(thrown);
        assert(venue->calls("cancelOrder") == 5);
        assert(venue->openOrderCount() == 2);
        assert(manager->liveLegCount() == 2);

        assert(manager->cancelAll() == 2);
        assert(venue->openOrderCount() == 0);
        assert(manager->liveLegCount() == 0);
    }

    // 조회가 정지 신호로 끊겨도 메모리 기준으로 취소
    {
        auto venue = std::make_shared<FakeVenue>();
        auto manager = makeManager(venue);
        manager->placeAll(1.0, 100.0);
        venue->interruptNext("getOpenOrders", 1);
        assert(manager->cancelAll() == 5);
        assert(manager->liveLegCount() == 0);
    }

    // 시작 시 고아 주문 정리
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->addOpenOrder(makeOrder("orphan-1", OrderSide::SELL, OrderType::LIMIT, "102", "0.2"));
        venue->addOpenOrder(makeOrder("orphan-2", OrderSide::SELL, OrderType::LIMIT, "104", "0.2"));
        venue->addOpenOrder(makeOrder("bid", OrderSide::BUY, OrderType::LIMIT, "90", "0.2"));
        auto manager = makeManager(venue);

        assert(manager->cancelOrphanedOrders(100.0, 1.0) == 2);
        assert(venue->openOrderCount() == 1);

        engine::TakeProfitSettings keep;
        keep.cancel_orphaned_orders = false;
        auto passive = makeManager(venue, keep);
        assert(passive->cancelOrphanedOrders(100.0, 1.0) == 0);
    }

    std::cout << "[TEST] TakeProfitManager PASSED\n";
    return 0;
}
