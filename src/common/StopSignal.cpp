#include "common/StopSignal.h"

namespace dcabot {
namespace common {

void StopSignal::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) return;
        stopped_ = true;
    }
    cv_.notify_all();
}

bool StopSignal::stopRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stopped_;
}

bool StopSignal::waitFor(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return stopped_; });
}

} // namespace common
} // namespace dcabot
