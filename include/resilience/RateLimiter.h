#pragma once

#include "common/StopSignal.h"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace dcabot {
namespace resilience {

// 토큰 버킷. 보충은 경과한 "정수 초" 단위로만 일어난다 (1초 미만 경과는 버림).
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        long long total_requests;
        long long rejected_requests;
        long long forced_waits;
        std::chrono::milliseconds total_wait_time;
    };

    RateLimiter(std::string name, int capacity, int refill_per_second);

    bool allow() { return allowN(1); }
    bool allowN(int n);

    // 토큰이 생길 때까지 대기. 정지 신호로 끊기면 false.
    bool waitN(const common::StopSignal* stop, int n = 1);

    // 429 응답 후 호출: 남은 토큰을 비워 다음 호출이 보충을 기다리게 함
    void drain();

    int availableTokens();
    std::chrono::milliseconds waitTimeFor(int n);

    Stats getStats() const;
    const std::string& name() const { return name_; }
    int capacity() const { return capacity_; }

private:
    void refill(Clock::time_point now);

    std::string name_;
    int capacity_;
    int refill_rate_;
    int tokens_;
    Clock::time_point last_refill_;

    long long total_requests_ = 0;
    long long rejected_requests_ = 0;
    long long forced_waits_ = 0;
    std::chrono::milliseconds total_wait_time_{0};

    mutable std::mutex mutex_;
};

class RateLimiterRegistry {
public:
    std::shared_ptr<RateLimiter> getOrCreate(const std::string& name, int capacity, int refill_per_second);
    std::shared_ptr<RateLimiter> find(const std::string& name) const;

private:
    std::map<std::string, std::shared_ptr<RateLimiter>> limiters_;
    mutable std::mutex mutex_;
};

} // namespace resilience
} // namespace dcabot
