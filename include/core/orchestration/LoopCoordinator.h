#pragma once

#include "common/BoundedQueue.h"
#include "common/StopSignal.h"
#include "engine/EngineConfig.h"
#include "exchange/IVenue.h"
#include "execution/TakeProfitManager.h"
#include "resilience/RecoveryHandler.h"
#include "risk/EntryGate.h"
#include "risk/EntrySizer.h"
#include "strategy/ISignalSource.h"
#include "sync/StateSynchronizer.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dcabot {
namespace core {

enum class ShutdownResult { GRACEFUL, FORCED };

const char* toString(ShutdownResult result);

// 루프가 조율하는 구성 요소 (모두 공유 소유)
struct LoopComponents {
    std::shared_ptr<exchange::IVenue> venue;
    std::shared_ptr<sync::StateSynchronizer> synchronizer;
    std::shared_ptr<execution::TakeProfitManager> take_profit;
    std::shared_ptr<risk::EntryGate> entry_gate;
    std::shared_ptr<strategy::ISignalSource> signal;
    std::shared_ptr<resilience::RecoveryHandler> recovery;
    std::shared_ptr<common::StopSignal> stop_signal;
    // 종료 정리 시한이 지나면 닫힌다 (GuardedVenue 의 정리 중 토큰 대기 취소)
    std::shared_ptr<common::StopSignal> cleanup_signal;
};

struct CycleReport {
    bool completed = false;
    bool entered = false;
    bool gate_blocked = false;
    int filled_legs = 0;
    std::string status;
};

// 캔들 경계마다 한 사이클: 동기화 -> 신호 + 게이트 -> 진입 -> 재동기화 -> 익절 정리 -> 상태 출력
class LoopCoordinator {
public:
    LoopCoordinator(const engine::EngineConfig& config, LoopComponents components);
    ~LoopCoordinator();

    LoopCoordinator(const LoopCoordinator&) = delete;
    LoopCoordinator& operator=(const LoopCoordinator&) = delete;

    // 워커 스레드에서 run()
    bool start();

    // 연결 + 초기 동기화 + 고아 주문 정리. 자격 증명 오류는 그대로 던진다.
    void initialize();

    // 정지 요청까지 블로킹
    void run();

    // 한 사이클. 예외는 밖으로 나가지 않는다.
    CycleReport runCycle();

    // 정지 요청 -> 워커 합류 -> 제한 시간 안에 정리. 두 번째 호출부터는 이전 결과.
    // 시간 초과이거나 레그 취소/청산이 끝나지 않으면 FORCED.
    ShutdownResult stop();

    bool isRunning() const { return running_; }
    bool isHalted() const { return halted_; }
    int cycleCount() const { return cycle_count_; }
    std::vector<std::string> drainErrors() { return errors_.drain(); }
    std::size_t droppedErrors() const { return errors_.dropped(); }

    static constexpr int kMaxCredentialFailures = 3;
    static constexpr std::size_t kErrorQueueCapacity = 64;

private:
    CycleReport executeCycle();
    bool tryEnter(const PositionSnapshot& snapshot, double price,
                  const std::vector<Candle>& candles, CycleReport& report);
    void reconcileTakeProfit(const PositionSnapshot& snapshot,
                             const std::vector<Candle>& candles,
                             double price, bool entered);
    std::string buildStatusLine(const PositionSnapshot& snapshot, double price) const;
    void reportError(const std::string& stage, const std::exception& e);
    void noteCredentialFailure();

    engine::EngineConfig config_;
    LoopComponents components_;
    risk::EntrySizer sizer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> halted_{false};
    std::atomic<int> cycle_count_{0};
    int credential_failures_ = 0;

    common::BoundedQueue<std::string> errors_{kErrorQueueCapacity};
    std::unique_ptr<std::thread> worker_thread_;

    std::mutex stop_mutex_;
    bool stopped_ = false;
    ShutdownResult shutdown_result_ = ShutdownResult::GRACEFUL;
};

} // namespace core
} // namespace dcabot
