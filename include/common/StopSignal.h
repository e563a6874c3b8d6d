#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dcabot {
namespace common {

// 한 번만 닫히는 정지 신호. 모든 대기 지점(백오프, 토큰 대기, 주기 대기)이 공유한다.
class StopSignal {
public:
    void requestStop();
    bool stopRequested() const;

    // 정지 요청이 오면 true, 시간이 다 되면 false
    bool waitFor(std::chrono::milliseconds duration) const;

    template<typename Clock, typename Duration>
    bool waitUntil(const std::chrono::time_point<Clock, Duration>& deadline) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, deadline, [this] { return stopped_; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool stopped_ = false;
};

} // namespace common
} // namespace dcabot
