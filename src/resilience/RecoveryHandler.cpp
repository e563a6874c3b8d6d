#include "resilience/RecoveryHandler.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <thread>

namespace dcabot {
namespace resilience {

BackoffStrategy parseBackoffStrategy(const std::string& name) {
    if (name == "linear") return BackoffStrategy::LINEAR;
    if (name == "fixed") return BackoffStrategy::FIXED;
    if (name == "exponential") return BackoffStrategy::EXPONENTIAL;
    throw BotError(ErrorCategory::VALIDATION, "invalid backoff strategy: " + name);
}

RecoveryHandler::RecoveryHandler(RecoveryConfig config,
                                 std::shared_ptr<common::StopSignal> stop_signal)
    : config_(std::move(config))
    , stop_signal_(std::move(stop_signal))
    , stats_(config_.stats_window) {}

RecoveryDecision RecoveryHandler::handleError(const BotError& error, int attempt) {
    std::lock_guard<std::mutex> lock(mutex_);

    stats_.record(error.category());

    if (error.isFatal()) {
        LOG_ERROR("FATAL ERROR [{}] {}.{}: {}", toString(error.category()),
                  error.component(), error.operation(), error.what());
    } else if (attempt > 0) {
        LOG_WARN("Attempt {} - [{}] {}.{}: {}", attempt + 1, toString(error.category()),
                 error.component(), error.operation(), error.what());
    } else {
        LOG_DEBUG("Error occurred [{}] {}.{}: {}", toString(error.category()),
                  error.component(), error.operation(), error.what());
    }

    RecoveryDecision decision;
    std::string reason;
    if (shouldStop(error, attempt, reason)) {
        decision.action = RecoveryAction::STOP;
        decision.should_stop = true;
        decision.message = reason;
        return decision;
    }

    decision.action = error.recoveryAction();
    decision.delay = calculateDelay(error.category(), attempt);
    decision.message = std::string(toString(decision.action)) + " after " + toString(error.category()) + " error";
    return decision;
}

bool RecoveryHandler::shouldStop(const BotError& error, int attempt, std::string& reason) const {
    if (error.isFatal()) {
        reason = "fatal error in " + error.component() + ": " + error.what();
        return true;
    }

    auto it = config_.max_retries.find(error.category());
    const int budget = it == config_.max_retries.end() ? 0 : it->second;
    if (attempt >= budget) {
        reason = "maximum retries (" + std::to_string(budget) + ") exceeded for " +
                 toString(error.category()) + " errors";
        return true;
    }

    if (stats_.hasRecentErrors(error.category(), config_.recent_error_limit)) {
        reason = std::string("too many recent ") + toString(error.category()) + " errors";
        return true;
    }

    return hasCriticalErrorCombination(reason);
}

bool RecoveryHandler::hasCriticalErrorCombination(std::string& reason) const {
    if (stats_.recentRate(ErrorCategory::CREDENTIALS) > config_.credential_rate_limit) {
        reason = "high credential error rate";
        return true;
    }
    if (stats_.recentRate(ErrorCategory::ORDER) > config_.order_rate_limit &&
        stats_.totalErrors() > config_.order_rate_min_sample) {
        reason = "high order error rate";
        return true;
    }
    return false;
}

std::chrono::milliseconds RecoveryHandler::calculateDelay(ErrorCategory category, int attempt) const {
    const auto base = category == ErrorCategory::RATE_LIMIT
        ? config_.rate_limit_base_delay
        : config_.base_delay;

    double delay_ms = static_cast<double>(base.count());
    switch (config_.strategy) {
        case BackoffStrategy::EXPONENTIAL:
            delay_ms *= std::pow(config_.multiplier, attempt);
            break;
        case BackoffStrategy::LINEAR:
            delay_ms *= static_cast<double>(attempt + 1);
            break;
        case BackoffStrategy::FIXED:
            break;
    }

    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_delay.count()));
    delay_ms = std::min(delay_ms, static_cast<double>(config_.max_backoff.count()));

    auto delay = std::chrono::milliseconds(static_cast<long long>(delay_ms));
    return config_.jitter ? addJitter(delay) : delay;
}

std::chrono::milliseconds RecoveryHandler::addJitter(std::chrono::milliseconds delay) const {
    const long long span = delay.count() / 10;
    if (span <= 0) {
        return delay;
    }
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<long long> dist(0, span - 1);
    return delay + std::chrono::milliseconds(dist(rng));
}

void RecoveryHandler::execute(const std::string& component,
                              const std::string& operation,
                              const std::function<void()>& fn) {
    std::optional<BotError> last_error;

    for (int attempt = 0; attempt < config_.max_attempts; ++attempt) {
        if (stop_signal_ && stop_signal_->stopRequested()) {
            throw OperationCancelled(component + "." + operation);
        }

        try {
            fn();
            if (attempt > 0) {
                LOG_INFO("Operation {}.{} succeeded after {} attempts", component, operation, attempt + 1);
            }
            return;
        } catch (const OperationCancelled&) {
            throw;
        } catch (const std::exception& e) {
            last_error = categorizeError(e, component, operation);
        }

        auto decision = handleError(*last_error, attempt);

        if (decision.should_stop) {
            LOG_ERROR("Stopping {}.{}: {}", component, operation, decision.message);
            throw *last_error;
        }

        if (decision.action == RecoveryAction::SKIP) {
            LOG_WARN("Skipping {}.{}: non-retryable {} error", component, operation,
                     toString(last_error->category()));
            throw *last_error;
        }

        // 마지막 시도 뒤에는 기다리지 않는다
        if (attempt + 1 < config_.max_attempts && decision.delay.count() > 0) {
            LOG_DEBUG("Waiting {}ms before retry: {}", decision.delay.count(), decision.message);
            if (stop_signal_) {
                if (stop_signal_->waitFor(decision.delay)) {
                    throw OperationCancelled(component + "." + operation);
                }
            } else {
                std::this_thread::sleep_for(decision.delay);
            }
        }
    }

    if (!last_error) {
        throw BotError(ErrorCategory::FATAL, "no attempts configured for " + component + "." + operation);
    }
    throw BotError(last_error->category(),
                   "operation failed after maximum attempts: " + std::string(last_error->what()),
                   false, last_error->code()).withContext(component, operation);
}

ErrorStats RecoveryHandler::getErrorStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

void RecoveryHandler::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = ErrorStats(config_.stats_window);
}

} // namespace resilience
} // namespace dcabot
