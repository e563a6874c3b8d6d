#include "common/StopSignal.h"
#include "resilience/RecoveryHandler.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace dcabot::resilience;
using dcabot::common::StopSignal;

namespace {
RecoveryConfig fastConfig() {
    RecoveryConfig config;
    config.base_delay = std::chrono::milliseconds(1);
    config.rate_limit_base_delay = std::chrono::milliseconds(1);
    config.jitter = false;
    return config;
}

ErrorCategory categoryOf(const std::string& message) {
    return categorizeError(std::runtime_error(message), "test", "op").category();
}

// fn 을 실행하고 던져진 BotError 를 돌려준다
template<typename Fn>
BotError expectFailure(RecoveryHandler& handler, Fn fn) {
    try {
        handler.execute("test", "op", fn);
    } catch (const BotError& e) {
        return e;
    }
    assert(false && "expected BotError");
    return BotError(ErrorCategory::FATAL, "unreachable");
}
}

int main() {
    // 메시지 기반 분류
    {
        assert(categoryOf("request timeout after 30s") == ErrorCategory::TIMEOUT);
        assert(categoryOf("connection reset by peer") == ErrorCategory::NETWORK);
        assert(categoryOf("invalid api key") == ErrorCategory::CREDENTIALS);
        assert(categoryOf("Too Many Requests") == ErrorCategory::RATE_LIMIT);
        assert(categoryOf("insufficient balance") == ErrorCategory::ORDER);
        assert(categoryOf("quantity below minimum") == ErrorCategory::VALIDATION);
        assert(categoryOf("something odd happened") == ErrorCategory::TEMPORARY);

        const BotError order = categorizeError(std::runtime_error("insufficient margin"), "c", "o");
        assert(!order.retryable());
        assert(order.component() == "c" && order.operation() == "o");

        const BotError typed(ErrorCategory::POSITION, "position mismatch");
        const BotError passed = categorizeError(typed, "sync", "syncPosition");
        assert(passed.category() == ErrorCategory::POSITION);
        assert(passed.component() == "sync");
    }

    // 재시도 후 성공
    {
        RecoveryHandler handler(fastConfig());
        int calls = 0;
        handler.execute("test", "op", [&calls]() {
            if (++calls < 3) {
                throw std::runtime_error("connection refused");
            }
        });
        assert(calls == 3);
        assert(handler.getErrorStats().totalErrors(ErrorCategory::NETWORK) == 2);
    }

    // 값을 돌려주는 실행
    {
        RecoveryHandler handler(fastConfig());
        int calls = 0;
        const int value = handler.executeFor("test", "op", [&calls]() {
            if (++calls == 1) {
                throw std::runtime_error("network unreachable");
            }
            return 42;
        });
        assert(value == 42);
        assert(calls == 2);
    }

    // 카테고리 예산: timeout 3 회 재시도 = 최대 4 회 호출
    {
        RecoveryHandler handler(fastConfig());
        int calls = 0;
        const BotError e = expectFailure(handler, [&calls]() {
            calls++;
            throw std::runtime_error("read timeout");
        });
        assert(calls == 4);
        assert(e.category() == ErrorCategory::TIMEOUT);
    }

    // 자격 증명 오류는 즉시 중단
    {
        RecoveryHandler handler(fastConfig());
        int calls = 0;
        const BotError e = expectFailure(handler, [&calls]() {
            calls++;
            throw BotError(ErrorCategory::CREDENTIALS, "API key is invalid", 10003);
        });
        assert(calls == 1);
        assert(e.category() == ErrorCategory::CREDENTIALS);
        assert(e.code() == 10003);
    }

    // 재시도 불가 주문 오류는 건너뜀
    {
        RecoveryHandler handler(fastConfig());
        int calls = 0;
        const BotError e = expectFailure(handler, [&calls]() {
            calls++;
            throw std::runtime_error("insufficient balance");
        });
        assert(calls == 1);
        assert(e.category() == ErrorCategory::ORDER);
    }

    // 최근 창에 같은 카테고리가 몰리면 예산 전에 중단
    {
        RecoveryConfig config = fastConfig();
        config.recent_error_limit = 3;
        RecoveryHandler handler(config);
        int calls = 0;
        expectFailure(handler, [&calls]() {
            calls++;
            throw std::runtime_error("connection refused");
        });
        assert(calls == 3);
    }

    // 주문 오류 비율 > 80% 이고 표본이 충분하면 중단
    {
        RecoveryConfig config = fastConfig();
        config.max_retries[ErrorCategory::ORDER] = 20;
        config.recent_error_limit = 100;
        config.order_rate_min_sample = 5;
        RecoveryHandler handler(config);
        int calls = 0;
        const BotError e = expectFailure(handler, [&calls]() {
            calls++;
            throw BotError(ErrorCategory::ORDER, "order rejected", true, 110007);
        });
        assert(calls == 6);
        assert(e.category() == ErrorCategory::ORDER);
    }

    // 호출 상한
    {
        RecoveryConfig config = fastConfig();
        config.max_retries[ErrorCategory::TEMPORARY] = 100;
        config.recent_error_limit = 100;
        config.max_attempts = 3;
        RecoveryHandler handler(config);
        int calls = 0;
        const BotError e = expectFailure(handler, [&calls]() {
            calls++;
            throw std::runtime_error("upstream hiccup");
        });
        assert(calls == 3);
        assert(std::string(e.what()).find("maximum attempts") != std::string::npos);
        assert(!e.retryable());
    }

    // 마지막 시도가 실패하면 백오프 없이 바로 실패
    {
        RecoveryConfig config = fastConfig();
        config.rate_limit_base_delay = std::chrono::milliseconds(400);
        config.max_attempts = 2;
        RecoveryHandler handler(config);
        int calls = 0;
        const auto started = std::chrono::steady_clock::now();
        const BotError e = expectFailure(handler, [&calls]() {
            calls++;
            throw std::runtime_error("Too Many Requests");
        });
        const auto elapsed = std::chrono::steady_clock::now() - started;
        assert(calls == 2);
        assert(e.category() == ErrorCategory::RATE_LIMIT);
        // 첫 재시도 전 400ms 만 기다리고, 두 번째 실패 뒤 600ms 는 건너뜀
        assert(elapsed >= std::chrono::milliseconds(400));
        assert(elapsed < std::chrono::milliseconds(900));
    }

    // 백오프 대기 중 정지 신호
    {
        RecoveryConfig config = fastConfig();
        config.base_delay = std::chrono::seconds(5);
        auto stop = std::make_shared<StopSignal>();
        RecoveryHandler handler(config, stop);

        std::thread stopper([stop]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            stop->requestStop();
        });

        const auto started = std::chrono::steady_clock::now();
        bool cancelled = false;
        try {
            handler.execute("test", "op", []() { throw std::runtime_error("connection refused"); });
        } catch (const OperationCancelled&) {
            cancelled = true;
        }
        stopper.join();
        assert(cancelled);
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    }

    // 지연 계산
    {
        RecoveryConfig config;
        config.jitter = false;
        RecoveryHandler exponential(config);
        assert(exponential.calculateDelay(ErrorCategory::NETWORK, 0) == std::chrono::milliseconds(1000));
        assert(exponential.calculateDelay(ErrorCategory::NETWORK, 2) == std::chrono::milliseconds(2250));
        assert(exponential.calculateDelay(ErrorCategory::NETWORK, 20) == std::chrono::milliseconds(30000));
        assert(exponential.calculateDelay(ErrorCategory::RATE_LIMIT, 0) == std::chrono::milliseconds(30000));

        config.strategy = BackoffStrategy::LINEAR;
        RecoveryHandler linear(config);
        assert(linear.calculateDelay(ErrorCategory::TIMEOUT, 2) == std::chrono::milliseconds(3000));

        config.strategy = parseBackoffStrategy("fixed");
        RecoveryHandler fixed(config);
        assert(fixed.calculateDelay(ErrorCategory::TIMEOUT, 5) == std::chrono::milliseconds(1000));

        config.jitter = true;
        config.strategy = BackoffStrategy::FIXED;
        RecoveryHandler jittered(config);
        const auto delay = jittered.calculateDelay(ErrorCategory::NETWORK, 0);
        assert(delay >= std::chrono::milliseconds(1000) && delay < std::chrono::milliseconds(1100));
    }

    std::cout << "[TEST] RecoveryHandler PASSED\n";
    return 0;
}
