#include "sync/StateSynchronizer.h"
#include "common/Logger.h"
#include "common/NumberUtils.h"
#include "resilience/BotError.h"

#include <algorithm>
#include <cmath>

namespace dcabot {
namespace sync {

const char* toString(SyncOutcome outcome) {
    switch (outcome) {
        case SyncOutcome::OPEN: return "open";
        case SyncOutcome::FLAT: return "flat";
        case SyncOutcome::RESET: return "reset";
    }
    return "unknown";
}

StateSynchronizer::StateSynchronizer(std::shared_ptr<exchange::IVenue> venue,
                                     std::string category,
                                     std::string symbol,
                                     double base_amount,
                                     std::shared_ptr<common::StopSignal> stop_signal,
                                     std::chrono::milliseconds retry_delay)
    : venue_(std::move(venue))
    , category_(std::move(category))
    , symbol_(std::move(symbol))
    , base_amount_(base_amount)
    , stop_signal_(std::move(stop_signal))
    , retry_delay_(retry_delay) {
    replica_.symbol = symbol_;
}

std::vector<VenuePosition> StateSynchronizer::fetchPositionsWithRetry() {
    std::string last_error;
    for (int attempt = 1; attempt <= kFetchAttempts; ++attempt) {
        try {
            return venue_->getPositions(category_, symbol_);
        } catch (const resilience::OperationCancelled&) {
            throw;
        } catch (const resilience::BotError& e) {
            // 자격 증명 오류는 재시도 없이 호출자에게
            if (e.isFatal()) {
                throw;
            }
            last_error = e.what();
            LOG_WARN("Position sync attempt {} failed: {}", attempt, last_error);
        } catch (const std::exception& e) {
            last_error = e.what();
            LOG_WARN("Position sync attempt {} failed: {}", attempt, last_error);
        }

        if (attempt < kFetchAttempts) {
            // 500ms, 1s 후 재시도
            const auto delay = retry_delay_ * attempt;
            if (stop_signal_ && stop_signal_->waitFor(delay)) {
                throw resilience::OperationCancelled("syncPosition");
            }
        }
    }

    throw resilience::BotError(resilience::ErrorCategory::POSITION,
                               "failed to get current positions after " +
                               std::to_string(kFetchAttempts) + " attempts: " + last_error);
}

SyncOutcome StateSynchronizer::syncPosition() {
    const auto positions = fetchPositionsWithRetry();

    bool found = false;
    double size = 0.0;
    double value = 0.0;
    double avg_price = 0.0;

    for (const auto& pos : positions) {
        if (pos.symbol != symbol_) {
            continue;
        }

        const auto parsed_value = common::tryParseDecimal(pos.position_value);
        const auto parsed_avg = common::tryParseDecimal(pos.avg_price);
        const auto parsed_size = common::tryParseDecimal(pos.size);

        if (!parsed_value && !parsed_avg && !parsed_size) {
            LOG_WARN("Skipping unparsable position record for {}", symbol_);
            continue;
        }

        const bool has_size = parsed_size && *parsed_size > kMinPositionSize;
        const bool has_value = parsed_value && *parsed_value > kMinPositionValue;
        const bool has_price = parsed_avg && *parsed_avg > 0.0;

        // side 필드와 무관하게 수량/가치 + 평균가가 있으면 채택
        if ((has_size || has_value) && has_price) {
            avg_price = *parsed_avg;
            value = parsed_value ? *parsed_value : 0.0;
            size = parsed_size ? *parsed_size : 0.0;
            if (size <= 0.0 && value > 0.0) {
                size = value / avg_price;
            }
            if (value <= 0.0 && size > 0.0) {
                value = size * avg_price;
            }
            found = true;
            break;
        }
    }

    ResyncCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (found) {
            if (replica_.avg_price > 0.0 && std::fabs(avg_price - replica_.avg_price) > 0.0001) {
                LOG_INFO("Average price changed: {:.4f} -> {:.4f}", replica_.avg_price, avg_price);
            }

            replica_.size = size;
            replica_.notional = value;
            replica_.avg_price = avg_price;

            // 레벨 추정은 콜드 스타트에서만
            if (replica_.dca_level == 0 && base_amount_ > 0.0) {
                replica_.dca_level = std::max(1, static_cast<int>(value / base_amount_));
                LOG_INFO("Startup: estimated DCA level {} (position {:.2f}, base {:.2f})",
                         replica_.dca_level, value, base_amount_);
            }
            return SyncOutcome::OPEN;
        }

        if (replica_.size <= 0.0 && replica_.notional <= 0.0) {
            return SyncOutcome::FLAT;
        }

        LOG_WARN("Venue reports no {} position while local replica is open, resetting", symbol_);
        replica_.size = 0.0;
        replica_.notional = 0.0;
        replica_.avg_price = 0.0;
        replica_.dca_level = 0;
        callback = resync_callback_;
    }

    if (callback) {
        callback();
    }
    return SyncOutcome::RESET;
}

double StateSynchronizer::syncBalance(const std::string& coin) {
    const double balance = venue_->getTradableBalance(coin);
    std::lock_guard<std::mutex> lock(mutex_);
    replica_.balance = balance;
    return balance;
}

int StateSynchronizer::recordEntry() {
    std::lock_guard<std::mutex> lock(mutex_);
    replica_.dca_level++;
    return replica_.dca_level;
}

PositionSnapshot StateSynchronizer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return replica_;
}

int StateSynchronizer::dcaLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return replica_.dca_level;
}

void StateSynchronizer::setResyncCallback(ResyncCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    resync_callback_ = std::move(callback);
}

void StateSynchronizer::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    replica_.size = 0.0;
    replica_.notional = 0.0;
    replica_.avg_price = 0.0;
    replica_.dca_level = 0;
}

} // namespace sync
} // namespace dcabot
