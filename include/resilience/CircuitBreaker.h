#pragma once

#include "resilience/BotError.h"

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dcabot {
namespace resilience {

enum class CircuitState { CLOSED, OPEN, HALF_OPEN };

const char* toString(CircuitState state);

struct CircuitBreakerConfig {
    int failure_threshold = 5;
    int success_threshold = 3;
    std::chrono::milliseconds timeout{30000};
    // reset_timeout 창 안에서 이 횟수만큼 실패하면 timeout 두 배로 차단
    int max_failures = 10;
    std::chrono::milliseconds reset_timeout{300000};
};

class CircuitOpenError : public BotError {
public:
    explicit CircuitOpenError(const std::string& name)
        : BotError(ErrorCategory::TEMPORARY, "circuit breaker " + name + " is open") {}
};

class CircuitBreaker {
public:
    using Clock = std::chrono::steady_clock;
    // 상태 전이 때 별도 스레드에서 호출된다 (상태 머신을 막지 않음)
    using StateChangeCallback =
        std::function<void(const std::string& name, CircuitState from, CircuitState to)>;

    struct Stats {
        std::string name;
        CircuitState state;
        int failures;
        int successes;
        int window_failures;
        long long rejected_calls;
        Clock::time_point next_attempt;
    };

    explicit CircuitBreaker(std::string name, CircuitBreakerConfig config = CircuitBreakerConfig());

    void setStateChangeCallback(StateChangeCallback callback);

    // 차단 중이면 fn 을 부르지 않고 CircuitOpenError
    void call(const std::function<void()>& fn);

    template<typename Fn>
    auto execute(Fn fn) -> decltype(fn()) {
        if (!canExecute()) {
            throw CircuitOpenError(name_);
        }
        try {
            auto result = fn();
            recordSuccess();
            return result;
        } catch (...) {
            recordFailure();
            throw;
        }
    }

    bool canExecute();
    void recordSuccess();
    void recordFailure();

    CircuitState getState() const;
    Stats getStats() const;
    const std::string& name() const { return name_; }

    void reset();
    void forceOpen();

private:
    void toClosed();
    void toOpen(std::chrono::milliseconds timeout);
    void changeState(CircuitState next);
    int pruneWindow(Clock::time_point now);

    std::string name_;
    CircuitBreakerConfig config_;
    CircuitState state_ = CircuitState::CLOSED;
    int failures_ = 0;
    int successes_ = 0;
    long long rejected_calls_ = 0;
    std::deque<Clock::time_point> failure_window_;
    Clock::time_point next_attempt_{};
    StateChangeCallback on_state_change_;
    mutable std::mutex mutex_;
};

// 작업 분류(trading / market_data / account_data)별 차단기 공유
class CircuitBreakerRegistry {
public:
    std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& name,
                                                const CircuitBreakerConfig& config = CircuitBreakerConfig());
    std::shared_ptr<CircuitBreaker> find(const std::string& name) const;

    bool hasOpenCircuits() const;
    std::vector<std::string> getOpenCircuits() const;
    std::vector<CircuitBreaker::Stats> getAllStats() const;
    void resetAll();

private:
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace dcabot
