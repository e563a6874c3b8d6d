#include "resilience/RateLimiter.h"
#include "resilience/BotError.h"
#include "common/Logger.h"

#include <algorithm>
#include <thread>

namespace dcabot {
namespace resilience {

namespace {
// 타이밍 오차용 여유
constexpr std::chrono::milliseconds kWaitBuffer{100};
}

RateLimiter::RateLimiter(std::string name, int capacity, int refill_per_second)
    : name_(std::move(name))
    , capacity_(capacity > 0 ? capacity : 1)
    , refill_rate_(refill_per_second > 0 ? refill_per_second : 1)
    , tokens_(capacity_)
    , last_refill_(Clock::now())
{
    LOG_INFO("RateLimiter {} initialized (capacity={}, refill={}/s)", name_, capacity_, refill_rate_);
}

void RateLimiter::refill(Clock::time_point now) {
    const auto elapsed = now - last_refill_;
    if (elapsed < std::chrono::seconds(1)) {
        return;
    }

    const auto whole_seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    const long long to_add = whole_seconds * static_cast<long long>(refill_rate_);
    tokens_ = static_cast<int>(std::min<long long>(capacity_, tokens_ + to_add));
    last_refill_ = now;
}

bool RateLimiter::allowN(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(Clock::now());

    if (tokens_ >= n) {
        tokens_ -= n;
        total_requests_++;
        return true;
    }
    rejected_requests_++;
    return false;
}

std::chrono::milliseconds RateLimiter::waitTimeFor(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(Clock::now());
    const int needed = n - tokens_;
    if (needed <= 0) {
        return std::chrono::milliseconds(0);
    }
    const auto wait_ms = static_cast<long long>(
        static_cast<double>(needed) / static_cast<double>(refill_rate_) * 1000.0);
    return std::chrono::milliseconds(wait_ms) + kWaitBuffer;
}

bool RateLimiter::waitN(const common::StopSignal* stop, int n) {
    if (n > capacity_) {
        throw BotError(ErrorCategory::VALIDATION,
                       "requested " + std::to_string(n) + " tokens exceeds maximum bucket capacity of " + name_);
    }

    // 토큰이 있으면 정지 요청 중에도 통과 (종료 정리 호출용), 대기만 취소된다
    while (true) {
        if (allowN(n)) {
            return true;
        }
        if (stop && stop->stopRequested()) {
            return false;
        }

        const auto wait = waitTimeFor(n);
        const auto wait_start = Clock::now();
        bool stopped = false;
        if (stop) {
            stopped = stop->waitFor(wait);
        } else {
            std::this_thread::sleep_for(wait);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            forced_waits_++;
            total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
                Clock::now() - wait_start);
        }
        if (stopped) {
            return false;
        }
    }
}

void RateLimiter::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_WARN("RateLimiter {} drained after rate limit response", name_);
    tokens_ = 0;
    last_refill_ = Clock::now();
}

int RateLimiter::availableTokens() {
    std::lock_guard<std::mutex> lock(mutex_);
    refill(Clock::now());
    return tokens_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;
    return stats;
}

std::shared_ptr<RateLimiter> RateLimiterRegistry::getOrCreate(
    const std::string& name, int capacity, int refill_per_second
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = limiters_.find(name);
    if (it != limiters_.end()) {
        return it->second;
    }
    auto limiter = std::make_shared<RateLimiter>(name, capacity, refill_per_second);
    limiters_.emplace(name, limiter);
    return limiter;
}

std::shared_ptr<RateLimiter> RateLimiterRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = limiters_.find(name);
    return it == limiters_.end() ? nullptr : it->second;
}

} // namespace resilience
} // namespace dcabot
