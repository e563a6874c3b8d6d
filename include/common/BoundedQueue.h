#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <vector>

namespace dcabot {
namespace common {

// 용량 고정 큐. 가득 차면 새 항목을 버리고 false (보고 경로가 루프를 막지 않도록)
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

    bool tryPush(T item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.size() >= capacity_) {
            dropped_++;
            return false;
        }
        items_.push_back(std::move(item));
        return true;
    }

    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out(std::make_move_iterator(items_.begin()),
                           std::make_move_iterator(items_.end()));
        items_.clear();
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    std::size_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    std::size_t capacity_;
    std::deque<T> items_;
    std::size_t dropped_ = 0;
    mutable std::mutex mutex_;
};

} // namespace common
} // namespace dcabot
