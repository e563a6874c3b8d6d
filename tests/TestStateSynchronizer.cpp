#include "FakeVenue.h"
#include "resilience/BotError.h"
#include "sync/StateSynchronizer.h"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>

using namespace dcabot;
using dcabot::testing::FakeVenue;
using sync::StateSynchronizer;
using sync::SyncOutcome;

namespace {
bool near(double a, double b) { return std::fabs(a - b) < 1e-6; }

std::unique_ptr<StateSynchronizer> makeSync(const std::shared_ptr<FakeVenue>& venue,
                                            double base_amount = 40.0) {
    return std::make_unique<StateSynchronizer>(venue, "linear", "BTCUSDT", base_amount,
                                               std::make_shared<common::StopSignal>(),
                                               std::chrono::milliseconds(5));
}

VenuePosition rawPosition(const std::string& size, const std::string& value, const std::string& avg) {
    VenuePosition pos;
    pos.symbol = "BTCUSDT";
    pos.side = "Buy";
    pos.size = size;
    pos.position_value = value;
    pos.avg_price = avg;
    return pos;
}
}

int main() {
    // 콜드 스타트: 포지션 가치 / 기본 금액으로 레벨 추정
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(1.5, 100.0);                // 가치 150, base 40 -> 3
        auto sync = makeSync(venue);

        assert(sync->syncPosition() == SyncOutcome::OPEN);
        const auto snap = sync->snapshot();
        assert(snap.isOpen());
        assert(near(snap.size, 1.5));
        assert(near(snap.notional, 150.0));
        assert(near(snap.avg_price, 100.0));
        assert(snap.dca_level == 3);
    }

    // 작은 포지션도 최소 레벨 1
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(0.1, 100.0);
        auto sync = makeSync(venue);
        sync->syncPosition();
        assert(sync->dcaLevel() == 1);
    }

    // 운용 중에는 레벨을 재계산하지 않는다
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(0.4, 100.0);
        auto sync = makeSync(venue);
        sync->syncPosition();
        assert(sync->dcaLevel() == 1);

        assert(sync->recordEntry() == 2);
        venue->setPosition(5.0, 95.0);                 // 가치 475 -> 추정했다면 11
        assert(sync->syncPosition() == SyncOutcome::OPEN);
        assert(sync->dcaLevel() == 2);
        assert(near(sync->snapshot().avg_price, 95.0));
    }

    // 거래소가 비었는데 복제본이 열려 있으면 초기화 + 콜백 정확히 한 번
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(1.0, 100.0);
        auto sync = makeSync(venue);
        int resyncs = 0;
        sync->setResyncCallback([&resyncs]() { resyncs++; });

        sync->syncPosition();
        sync->recordEntry();
        venue->clearPosition();

        assert(sync->syncPosition() == SyncOutcome::RESET);
        const auto snap = sync->snapshot();
        assert(snap.size == 0.0 && snap.notional == 0.0 && snap.avg_price == 0.0);
        assert(snap.dca_level == 0);
        assert(!snap.isOpen());
        assert(resyncs == 1);

        // 이미 평평하면 다시 호출되지 않는다
        assert(sync->syncPosition() == SyncOutcome::FLAT);
        assert(resyncs == 1);
    }

    // 방어적 파싱: 잘못된 값이나 0 평균가는 포지션으로 인정하지 않는다
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->raw_positions_override = true;
        venue->raw_positions = {
            rawPosition("", " ", "null"),
            rawPosition("0.5", "50", "0"),
            rawPosition("NaN", "undefined", "100"),
        };
        auto sync = makeSync(venue);
        assert(sync->syncPosition() == SyncOutcome::FLAT);
        assert(!sync->snapshot().isOpen());

        // 수량이 비어 있어도 가치와 평균가가 있으면 채택
        venue->raw_positions = {rawPosition("", "200", "100")};
        assert(sync->syncPosition() == SyncOutcome::OPEN);
        assert(near(sync->snapshot().size, 2.0));

        // 다른 심볼은 무시
        VenuePosition other = rawPosition("1", "100", "100");
        other.symbol = "ETHUSDT";
        venue->raw_positions = {other};
        assert(sync->syncPosition() == SyncOutcome::RESET);
    }

    // 조회 실패는 3 회까지 재시도
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->setPosition(1.0, 100.0);
        auto sync = makeSync(venue);

        venue->failNext("getPositions", 2);
        assert(sync->syncPosition() == SyncOutcome::OPEN);
        assert(venue->calls("getPositions") == 3);

        venue->failNext("getPositions", 3);
        bool thrown = false;
        try {
            sync->syncPosition();
        } catch (const resilience::BotError& e) {
            thrown = e.category() == resilience::ErrorCategory::POSITION;
        }
        assert(thrown);
        assert(venue->calls("getPositions") == 6);
        // 이전 값 유지
        assert(sync->snapshot().isOpen());
    }

    // 자격 증명 오류는 재시도하지 않고 그대로
    {
        auto venue = std::make_shared<FakeVenue>();
        auto sync = makeSync(venue);
        venue->failNext("getPositions", 3, resilience::ErrorCategory::CREDENTIALS);
        bool thrown = false;
        try {
            sync->syncPosition();
        } catch (const resilience::BotError& e) {
            thrown = e.category() == resilience::ErrorCategory::CREDENTIALS;
        }
        assert(thrown);
        assert(venue->calls("getPositions") == 1);
    }

    // 잔고
    {
        auto venue = std::make_shared<FakeVenue>();
        venue->balance = 321.5;
        auto sync = makeSync(venue);
        assert(near(sync->syncBalance("USDT"), 321.5));
        assert(near(sync->snapshot().balance, 321.5));
    }

    std::cout << "[TEST] StateSynchronizer PASSED\n";
    return 0;
}
