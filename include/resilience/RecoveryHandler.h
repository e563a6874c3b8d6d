#pragma once

#include "common/StopSignal.h"
#include "resilience/BotError.h"
#include "resilience/ErrorStats.h"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dcabot {
namespace resilience {

enum class BackoffStrategy { EXPONENTIAL, LINEAR, FIXED };

BackoffStrategy parseBackoffStrategy(const std::string& name);

struct RecoveryConfig {
    // 카테고리별 재시도 횟수 (호출은 최대 재시도 + 1 회)
    std::map<ErrorCategory, int> max_retries = {
        {ErrorCategory::NETWORK, 5},
        {ErrorCategory::TIMEOUT, 3},
        {ErrorCategory::TEMPORARY, 3},
        {ErrorCategory::RATE_LIMIT, 10},
        {ErrorCategory::ORDER, 2},
        {ErrorCategory::POSITION, 3},
        {ErrorCategory::STRATEGY, 1},
        {ErrorCategory::CREDENTIALS, 0},
        {ErrorCategory::VALIDATION, 0},
        {ErrorCategory::FATAL, 0},
    };

    BackoffStrategy strategy = BackoffStrategy::EXPONENTIAL;
    double multiplier = 1.5;
    bool jitter = true;

    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds rate_limit_base_delay{30000};
    std::chrono::milliseconds max_delay{30000};
    std::chrono::milliseconds max_backoff{300000};

    int max_attempts = 10;
    std::size_t stats_window = 50;
    int recent_error_limit = 10;
    double credential_rate_limit = 0.5;
    double order_rate_limit = 0.8;
    int order_rate_min_sample = 10;
};

struct RecoveryDecision {
    RecoveryAction action = RecoveryAction::RETRY;
    std::chrono::milliseconds delay{0};
    bool should_stop = false;
    std::string message;
};

class RecoveryHandler {
public:
    explicit RecoveryHandler(RecoveryConfig config = RecoveryConfig(),
                             std::shared_ptr<common::StopSignal> stop_signal = nullptr);

    // 오류 기록 + 다음 행동 결정. attempt 는 0 부터.
    RecoveryDecision handleError(const BotError& error, int attempt);

    // 실패하면 분류된 BotError, 정지 신호면 OperationCancelled 를 던진다
    void execute(const std::string& component,
                 const std::string& operation,
                 const std::function<void()>& fn);

    template<typename Fn>
    auto executeFor(const std::string& component, const std::string& operation, Fn fn)
        -> decltype(fn()) {
        std::optional<decltype(fn())> result;
        execute(component, operation, [&]() { result = fn(); });
        return std::move(*result);
    }

    std::chrono::milliseconds calculateDelay(ErrorCategory category, int attempt) const;

    ErrorStats getErrorStats() const;
    void resetStats();

private:
    bool shouldStop(const BotError& error, int attempt, std::string& reason) const;
    bool hasCriticalErrorCombination(std::string& reason) const;
    std::chrono::milliseconds addJitter(std::chrono::milliseconds delay) const;

    RecoveryConfig config_;
    std::shared_ptr<common::StopSignal> stop_signal_;
    ErrorStats stats_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace dcabot
