#include "resilience/CircuitBreaker.h"
#include "common/Logger.h"

#include <thread>

namespace dcabot {
namespace resilience {

const char* toString(CircuitState state) {
    switch (state) {
        case CircuitState::CLOSED: return "CLOSED";
        case CircuitState::OPEN: return "OPEN";
        case CircuitState::HALF_OPEN: return "HALF_OPEN";
    }
    return "UNKNOWN";
}

CircuitBreaker::CircuitBreaker(std::string name, CircuitBreakerConfig config)
    : name_(std::move(name))
    , config_(config)
{
    if (config_.failure_threshold <= 0) config_.failure_threshold = 5;
    if (config_.success_threshold <= 0) config_.success_threshold = 3;
    if (config_.timeout.count() <= 0) config_.timeout = std::chrono::seconds(30);
    if (config_.max_failures <= 0) config_.max_failures = 10;
    if (config_.reset_timeout.count() <= 0) config_.reset_timeout = std::chrono::minutes(5);
}

void CircuitBreaker::setStateChangeCallback(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_state_change_ = std::move(callback);
}

void CircuitBreaker::call(const std::function<void()>& fn) {
    if (!canExecute()) {
        throw CircuitOpenError(name_);
    }
    try {
        fn();
    } catch (...) {
        recordFailure();
        throw;
    }
    recordSuccess();
}

bool CircuitBreaker::canExecute() {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case CircuitState::CLOSED:
        case CircuitState::HALF_OPEN:
            return true;
        case CircuitState::OPEN:
            if (Clock::now() >= next_attempt_) {
                changeState(CircuitState::HALF_OPEN);
                successes_ = 0;
                return true;
            }
            rejected_calls_++;
            return false;
    }
    return false;
}

void CircuitBreaker::recordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_ = 0;

    switch (state_) {
        case CircuitState::HALF_OPEN:
            successes_++;
            if (successes_ >= config_.success_threshold) {
                toClosed();
            }
            break;
        case CircuitState::OPEN:
            toClosed();
            break;
        case CircuitState::CLOSED:
            break;
    }
}

void CircuitBreaker::recordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = Clock::now();
    failures_++;
    failure_window_.push_back(now);

    switch (state_) {
        case CircuitState::CLOSED:
            if (failures_ >= config_.failure_threshold) {
                toOpen(config_.timeout);
            }
            break;
        case CircuitState::HALF_OPEN:
            toOpen(config_.timeout);
            break;
        case CircuitState::OPEN:
            next_attempt_ = now + config_.timeout;
            break;
    }

    if (pruneWindow(now) >= config_.max_failures) {
        toOpen(config_.timeout * 2);
    }
}

CircuitState CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreaker::Stats CircuitBreaker::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats stats;
    stats.name = name_;
    stats.state = state_;
    stats.failures = failures_;
    stats.successes = successes_;
    stats.window_failures = static_cast<int>(failure_window_.size());
    stats.rejected_calls = rejected_calls_;
    stats.next_attempt = next_attempt_;
    return stats;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    toClosed();
}

void CircuitBreaker::forceOpen() {
    std::lock_guard<std::mutex> lock(mutex_);
    toOpen(config_.timeout);
}

void CircuitBreaker::toClosed() {
    changeState(CircuitState::CLOSED);
    failures_ = 0;
    successes_ = 0;
    failure_window_.clear();
}

void CircuitBreaker::toOpen(std::chrono::milliseconds timeout) {
    changeState(CircuitState::OPEN);
    next_attempt_ = Clock::now() + timeout;
    successes_ = 0;
}

void CircuitBreaker::changeState(CircuitState next) {
    const CircuitState previous = state_;
    state_ = next;
    if (previous == next) {
        return;
    }

    if (next == CircuitState::OPEN) {
        LOG_WARN("Circuit breaker {} {} -> {}", name_, toString(previous), toString(next));
    } else {
        LOG_INFO("Circuit breaker {} {} -> {}", name_, toString(previous), toString(next));
    }

    if (on_state_change_) {
        std::thread([callback = on_state_change_, name = name_, previous, next]() {
            try {
                callback(name, previous, next);
            } catch (const std::exception& e) {
                LOG_ERROR("Circuit breaker {} state callback failed: {}", name, e.what());
            }
        }).detach();
    }
}

int CircuitBreaker::pruneWindow(Clock::time_point now) {
    while (!failure_window_.empty() && now - failure_window_.front() > config_.reset_timeout) {
        failure_window_.pop_front();
    }
    return static_cast<int>(failure_window_.size());
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::getOrCreate(
    const std::string& name,
    const CircuitBreakerConfig& config
) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }
    auto breaker = std::make_shared<CircuitBreaker>(name, config);
    breakers_.emplace(name, breaker);
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    return it == breakers_.end() ? nullptr : it->second;
}

bool CircuitBreakerRegistry::hasOpenCircuits() const {
    return !getOpenCircuits().empty();
}

std::vector<std::string> CircuitBreakerRegistry::getOpenCircuits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> open;
    for (const auto& [name, breaker] : breakers_) {
        if (breaker->getState() == CircuitState::OPEN) {
            open.push_back(name);
        }
    }
    return open;
}

std::vector<CircuitBreaker::Stats> CircuitBreakerRegistry::getAllStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CircuitBreaker::Stats> all;
    for (const auto& [name, breaker] : breakers_) {
        all.push_back(breaker->getStats());
    }
    return all;
}

void CircuitBreakerRegistry::resetAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, breaker] : breakers_) {
        breaker->reset();
    }
}

} // namespace resilience
} // namespace dcabot
