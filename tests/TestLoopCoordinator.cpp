#include "FakeVenue.h"
#include "core/orchestration/LoopCoordinator.h"
#include "exchange/GuardedVenue.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <thread>

using namespace dcabot;
using dcabot::testing::FakeVenue;
using core::LoopComponents;
using core::LoopCoordinator;
using core::ShutdownResult;

namespace {

struct Harness {
    std::shared_ptr<FakeVenue> venue;
    std::shared_ptr<sync::StateSynchronizer> synchronizer;
    std::shared_ptr<execution::TakeProfitManager> take_profit;
    std::shared_ptr<common::StopSignal> stop;
    std::shared_ptr<common::StopSignal> cleanup;
    std::shared_ptr<resilience::RateLimiterRegistry> limiters;
    std::unique_ptr<LoopCoordinator> coordinator;
};

engine::EngineConfig testConfig() {
    engine::EngineConfig cfg;
    cfg.strategy.base_amount = 40.0;
    cfg.strategy.kline_limit = 100;
    cfg.strategy.min_klines = 70;
    cfg.shutdown.timeout_seconds = 5;
    cfg.resilience.recovery.base_delay = std::chrono::milliseconds(1);
    cfg.resilience.recovery.max_delay = std::chrono::milliseconds(5);
    return cfg;
}

// guarded 이면 기본 토큰 버킷/차단기를 둔 GuardedVenue 를 FakeVenue 앞에 둔다
Harness makeHarness(const engine::EngineConfig& cfg, bool guarded = false) {
    Harness h;
    h.venue = std::make_shared<FakeVenue>();
    h.stop = std::make_shared<common::StopSignal>();
    h.cleanup = std::make_shared<common::StopSignal>();

    std::shared_ptr<exchange::IVenue> venue = h.venue;
    if (guarded) {
        h.limiters = std::make_shared<resilience::RateLimiterRegistry>();
        venue = std::make_shared<exchange::GuardedVenue>(
            h.venue, cfg.resilience, h.limiters,
            std::make_shared<resilience::CircuitBreakerRegistry>(), h.stop, h.cleanup);
    }

    h.synchronizer = std::make_shared<sync::StateSynchronizer>(
        venue, cfg.exchange.category, cfg.exchange.symbol, cfg.strategy.base_amount,
        h.stop, std::chrono::milliseconds(1));
    h.take_profit = std::make_shared<execution::TakeProfitManager>(
        venue, cfg.exchange.category, cfg.exchange.symbol, cfg.take_profit,
        std::make_shared<strategy::FixedTakeProfit>(cfg.take_profit.base_percent));

    LoopComponents components;
    components.venue = venue;
    components.synchronizer = h.synchronizer;
    components.take_profit = h.take_profit;
    components.entry_gate = std::make_shared<risk::EntryGate>(
        std::make_shared<strategy::FixedProgressiveSpacing>());
    components.signal = std::make_shared<strategy::AlwaysEnterSignal>();
    components.recovery = std::make_shared<resilience::RecoveryHandler>(cfg.resilience.recovery, h.stop);
    components.stop_signal = h.stop;
    components.cleanup_signal = h.cleanup;

    h.coordinator = std::make_unique<LoopCoordinator>(cfg, components);
    return h;
}

int countLimitOrders(const std::vector<OrderRequest>& orders) {
    int n = 0;
    for (const auto& o : orders) {
        if (o.type == OrderType::LIMIT) n++;
    }
    return n;
}
}

int main() {
    // 구성 요소 누락
    {
        LoopComponents empty;
        try {
            LoopCoordinator coordinator(testConfig(), empty);
            assert(false);
        } catch (const resilience::BotError& e) {
            assert(e.category() == resilience::ErrorCategory::VALIDATION);
        }
    }

    // 진입 -> 게이트 차단 -> 추가 진입 -> 체결 감지 -> 종료 시 청산
    {
        auto h = makeHarness(testConfig());
        h.coordinator->initialize();
        assert(h.venue->connected());
        assert(h.synchronizer->dcaLevel() == 0);

        // 1. 첫 진입 + 익절 레그 5개
        auto report = h.coordinator->runCycle();
        assert(report.completed);
        assert(report.entered);
        assert(!report.gate_blocked);
        assert(h.synchronizer->dcaLevel() == 1);
        assert(std::fabs(h.venue->positionSize() - 0.4) < 1e-9);
        assert(h.venue->openOrderCount() == 5);
        assert(h.take_profit->liveLegCount() == 5);
        const auto first = h.venue->placedOrders();
        assert(first.front().type == OrderType::MARKET);
        assert(first.front().side == OrderSide::BUY);
        assert(first.front().quantity == "0.400");
        assert(countLimitOrders(first) == 5);
        assert(report.status.find("level=1") != std::string::npos);

        // 2. 가격 변화 없음 -> 차단, 주문 없음
        report = h.coordinator->runCycle();
        assert(report.completed);
        assert(!report.entered);
        assert(report.gate_blocked);
        assert(h.venue->placedOrders().size() == first.size());

        // 3. 5% 하락 -> 두 번째 진입 + 레그 재배치
        h.venue->price = 95.0;
        report = h.coordinator->runCycle();
        assert(report.entered);
        assert(h.synchronizer->dcaLevel() == 2);
        assert(h.venue->positionSize() > 0.4);
        assert(h.venue->cancelledOrders().size() == 5);
        assert(h.venue->openOrderCount() == 5);
        assert(h.take_profit->liveLegCount() == 5);

        // 4. 레그 하나 체결 -> 감지, 평균가 위라 진입 없음
        h.venue->price = 100.0;
        const auto legs = h.take_profit->trackedLegs();
        const double before_fill = h.venue->positionSize();
        h.venue->fillOrder(legs.front().order_id);
        report = h.coordinator->runCycle();
        assert(report.completed);
        assert(report.filled_legs == 1);
        assert(!report.entered);
        assert(h.take_profit->liveLegCount() == 4);
        assert(h.venue->positionSize() < before_fill);

        assert(h.coordinator->cycleCount() == 4);
        assert(h.coordinator->drainErrors().empty());

        // 종료: 레그 취소 + 시장가 청산 + 연결 해제
        assert(h.coordinator->stop() == ShutdownResult::GRACEFUL);
        assert(h.venue->positionSize() == 0.0);
        assert(h.venue->openOrderCount() == 0);
        assert(!h.venue->connected());
        const auto last = h.venue->placedOrders().back();
        assert(last.type == OrderType::MARKET);
        assert(last.side == OrderSide::SELL);
        assert(last.reduce_only);
        assert(h.synchronizer->dcaLevel() == 0);

        // 두 번째 stop 은 이전 결과
        const int disconnects = h.venue->calls("disconnect");
        assert(h.coordinator->stop() == ShutdownResult::GRACEFUL);
        assert(h.venue->calls("disconnect") == disconnects);
    }

    // 진입 후 포지션 조회가 계속 실패하면 평균가를 모르므로 추가 진입 차단
    {
        auto cfg = testConfig();
        cfg.shutdown.close_position_on_exit = false;
        auto h = makeHarness(cfg);
        h.venue->failNext("getPositions", 1000);

        auto report = h.coordinator->runCycle();
        assert(report.completed);
        assert(report.entered);
        assert(h.synchronizer->dcaLevel() == 1);
        assert(h.synchronizer->snapshot().avg_price == 0.0);
        assert(std::fabs(h.venue->positionSize() - 0.4) < 1e-9);

        for (int i = 0; i < 2; ++i) {
            report = h.coordinator->runCycle();
            assert(report.completed);
            assert(!report.entered);
            assert(report.gate_blocked);
        }
        assert(h.synchronizer->dcaLevel() == 1);
        assert(std::fabs(h.venue->positionSize() - 0.4) < 1e-9);
        int market_orders = 0;
        for (const auto& o : h.venue->placedOrders()) {
            if (o.type == OrderType::MARKET) market_orders++;
        }
        assert(market_orders == 1);
        assert(!h.coordinator->drainErrors().empty());
        assert(h.coordinator->stop() == ShutdownResult::GRACEFUL);
    }

    // 캔들 부족 -> 진입 생략
    {
        auto h = makeHarness(testConfig());
        h.venue->klines.assign(10, Candle(100, 101, 99, 100, 1, 0));
        auto report = h.coordinator->runCycle();
        assert(report.completed);
        assert(!report.entered);
        assert(h.venue->placedOrders().empty());
    }

    // 일시 오류는 기록만 하고 사이클은 계속
    {
        auto h = makeHarness(testConfig());
        h.synchronizer->syncBalance("USDT");
        h.venue->failNext("getTradableBalance", 1);
        auto report = h.coordinator->runCycle();
        assert(report.completed);
        assert(report.entered);
        auto errors = h.coordinator->drainErrors();
        assert(errors.size() == 1);
        assert(errors[0].find("syncBalance") == 0);
    }

    // 자격 증명 오류 3 회 연속 -> 정지
    {
        auto h = makeHarness(testConfig());
        h.venue->failNext("getTradableBalance", 3, resilience::ErrorCategory::CREDENTIALS);
        for (int i = 0; i < 3; ++i) {
            auto report = h.coordinator->runCycle();
            assert(!report.completed);
        }
        assert(h.coordinator->isHalted());
        assert(h.stop->stopRequested());
        auto report = h.coordinator->runCycle();
        assert(report.status == "halted");
        assert(h.venue->placedOrders().empty());
        assert(h.coordinator->drainErrors().size() == 3);
    }

    // 성공한 사이클이 있으면 연속 횟수 초기화
    {
        auto h = makeHarness(testConfig());
        h.venue->failNext("getTradableBalance", 2, resilience::ErrorCategory::CREDENTIALS);
        h.coordinator->runCycle();
        h.coordinator->runCycle();
        assert(h.coordinator->runCycle().completed);
        h.venue->failNext("getTradableBalance", 2, resilience::ErrorCategory::CREDENTIALS);
        h.coordinator->runCycle();
        h.coordinator->runCycle();
        assert(!h.coordinator->isHalted());
    }

    // 워커 스레드 시작 -> 정지 요청에 바로 빠져나옴
    {
        auto cfg = testConfig();
        cfg.shutdown.close_position_on_exit = false;
        auto h = makeHarness(cfg);
        assert(h.coordinator->start());
        assert(!h.coordinator->start());
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        assert(h.coordinator->isRunning());
        assert(h.coordinator->stop() == ShutdownResult::GRACEFUL);
        assert(!h.coordinator->isRunning());
        assert(h.venue->calls("placeOrder") == 0);
    }

    // 기본 거래 버킷(10/10) 뒤에서도 종료 정리는 보충을 기다려 레그 취소와 청산을 끝낸다
    {
        auto h = makeHarness(testConfig(), true);
        h.coordinator->initialize();
        assert(h.coordinator->runCycle().entered);
        assert(h.venue->openOrderCount() == 5);
        // 진입 1 + 레그 5 -> 남은 토큰 4, 정리에는 취소 5 + 청산 1 이 필요
        assert(h.limiters->find("trading")->availableTokens() == 4);

        assert(h.coordinator->stop() == ShutdownResult::GRACEFUL);
        assert(h.limiters->find("trading")->getStats().forced_waits > 0);
        assert(h.venue->openOrderCount() == 0);
        assert(h.take_profit->liveLegCount() == 0);
        assert(h.venue->positionSize() == 0.0);
        assert(!h.venue->connected());
        assert(!h.cleanup->stopRequested());
    }

    // 레그 취소가 실패하면 시간 안에 끝나도 강제 종료로 보고, 청산은 계속한다
    {
        auto h = makeHarness(testConfig());
        assert(h.coordinator->runCycle().entered);
        assert(h.venue->openOrderCount() == 5);

        h.venue->failNext("cancelOrder", 10);
        assert(h.coordinator->stop() == ShutdownResult::FORCED);
        assert(h.venue->calls("cancelOrder") == 5);
        assert(h.venue->openOrderCount() == 5);
        assert(h.take_profit->liveLegCount() == 5);
        assert(h.venue->positionSize() == 0.0);
        assert(!h.venue->connected());
    }

    // 정리가 제한 시간을 넘기면 강제 종료, 정리 자체는 뒤에서 끝난다
    {
        auto cfg = testConfig();
        cfg.take_profit.levels = 1;
        cfg.take_profit.level_fraction = 1.0;
        cfg.shutdown.timeout_seconds = 1;
        auto h = makeHarness(cfg);

        assert(h.coordinator->runCycle().entered);
        assert(h.venue->openOrderCount() == 1);

        h.venue->setCancelDelay(std::chrono::milliseconds(1500));
        const auto started = std::chrono::steady_clock::now();
        assert(h.coordinator->stop() == ShutdownResult::FORCED);
        const auto elapsed = std::chrono::steady_clock::now() - started;
        assert(elapsed < std::chrono::milliseconds(1400));
        assert(h.cleanup->stopRequested());

        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        assert(h.venue->openOrderCount() == 0);
        assert(h.venue->positionSize() == 0.0);
    }

    std::cout << "[TEST] LoopCoordinator PASSED\n";
    return 0;
}
