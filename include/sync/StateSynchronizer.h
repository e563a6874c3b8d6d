#pragma once

#include "common/StopSignal.h"
#include "common/Types.h"
#include "exchange/IVenue.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace dcabot {
namespace sync {

enum class SyncOutcome {
    OPEN,       // 거래소 포지션을 복제본에 반영
    FLAT,       // 양쪽 다 포지션 없음
    RESET       // 거래소가 외부에서 청산됨, 복제본 초기화
};

const char* toString(SyncOutcome outcome);

// 포지션 복제본의 유일한 쓰기 주체
class StateSynchronizer {
public:
    using ResyncCallback = std::function<void()>;

    StateSynchronizer(std::shared_ptr<exchange::IVenue> venue,
                      std::string category,
                      std::string symbol,
                      double base_amount,
                      std::shared_ptr<common::StopSignal> stop_signal,
                      std::chrono::milliseconds retry_delay = std::chrono::milliseconds(500));

    // 실패 시 BotError(POSITION). 호출자는 이전 사이클 값으로 계속 진행한다.
    SyncOutcome syncPosition();

    double syncBalance(const std::string& coin);

    // 진입 체결 후 DCA 레벨 + 1
    int recordEntry();

    PositionSnapshot snapshot() const;
    int dcaLevel() const;

    // 외부 청산 감지 시 한 번 호출 (잠금 밖에서)
    void setResyncCallback(ResyncCallback callback);

    // 종료 청산 후 복제본 초기화
    void reset();

    static constexpr int kFetchAttempts = 3;
    static constexpr double kMinPositionSize = 0.001;
    static constexpr double kMinPositionValue = 0.01;

private:
    std::vector<VenuePosition> fetchPositionsWithRetry();

    std::shared_ptr<exchange::IVenue> venue_;
    std::string category_;
    std::string symbol_;
    double base_amount_;
    std::shared_ptr<common::StopSignal> stop_signal_;
    std::chrono::milliseconds retry_delay_;

    mutable std::mutex mutex_;
    PositionSnapshot replica_;
    ResyncCallback resync_callback_;
};

} // namespace sync
} // namespace dcabot
