#include "common/StopSignal.h"
#include "resilience/BotError.h"
#include "resilience/RateLimiter.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using dcabot::common::StopSignal;
using dcabot::resilience::BotError;
using dcabot::resilience::ErrorCategory;
using dcabot::resilience::RateLimiter;
using dcabot::resilience::RateLimiterRegistry;
using Clock = std::chrono::steady_clock;

int main() {
    // 용량 10, 초당 10: 10 회 즉시 허용, 11 번째 거부, 1초 후 다시 허용
    {
        RateLimiter limiter("trading", 10, 10);
        for (int i = 0; i < 10; ++i) {
            assert(limiter.allow());
        }
        assert(!limiter.allow());

        std::this_thread::sleep_for(std::chrono::milliseconds(1100));
        assert(limiter.allow());

        const auto stats = limiter.getStats();
        assert(stats.total_requests == 11);
        assert(stats.rejected_requests == 1);
    }

    // 1초 미만 경과는 보충하지 않는다
    {
        RateLimiter limiter("slow", 2, 1);
        assert(limiter.allowN(2));
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        assert(!limiter.allow());
        assert(limiter.availableTokens() == 0);
    }

    // 정지 신호가 대기를 끊는다
    {
        RateLimiter limiter("cancel", 1, 1);
        assert(limiter.allow());

        StopSignal stop;
        std::thread stopper([&stop]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            stop.requestStop();
        });

        const auto started = Clock::now();
        const bool acquired = limiter.waitN(&stop, 1);
        const auto elapsed = Clock::now() - started;
        stopper.join();

        assert(!acquired);
        assert(elapsed < std::chrono::milliseconds(900));
    }

    // 토큰이 남아 있으면 정지 요청 후에도 통과
    {
        RateLimiter limiter("cleanup", 2, 1);
        StopSignal stop;
        stop.requestStop();
        assert(limiter.waitN(&stop, 1));
    }

    // 대기 후 획득
    {
        RateLimiter limiter("wait", 1, 1);
        assert(limiter.allow());
        const auto started = Clock::now();
        assert(limiter.waitN(nullptr, 1));
        assert(Clock::now() - started >= std::chrono::milliseconds(900));
        assert(limiter.getStats().forced_waits >= 1);
    }

    // 용량보다 큰 요청은 검증 오류
    {
        RateLimiter limiter("small", 3, 3);
        bool thrown = false;
        try {
            limiter.waitN(nullptr, 4);
        } catch (const BotError& e) {
            thrown = e.category() == ErrorCategory::VALIDATION;
        }
        assert(thrown);
    }

    // drain 후에는 보충 전까지 거부
    {
        RateLimiter limiter("drain", 5, 5);
        limiter.drain();
        assert(!limiter.allow());
        assert(limiter.waitTimeFor(1) > std::chrono::milliseconds(0));
    }

    // 레지스트리는 같은 이름에 같은 인스턴스
    {
        RateLimiterRegistry registry;
        auto a = registry.getOrCreate("market_data", 50, 50);
        auto b = registry.getOrCreate("market_data", 1, 1);
        assert(a == b);
        assert(a->capacity() == 50);
        assert(registry.find("trading") == nullptr);
    }

    std::cout << "[TEST] TokenBucket PASSED\n";
    return 0;
}
