#pragma once

#include "resilience/BotError.h"

#include <cstddef>
#include <deque>
#include <map>

namespace dcabot {
namespace resilience {

// 최근 N 개 분류 오류의 이동 창. 동기화는 소유자가 책임진다.
class ErrorStats {
public:
    explicit ErrorStats(std::size_t window = 50);

    void record(ErrorCategory category);

    int totalErrors() const { return total_errors_; }
    int totalErrors(ErrorCategory category) const;
    int recentCount(ErrorCategory category) const;
    std::size_t windowSize() const { return recent_.size(); }

    bool hasRecentErrors(ErrorCategory category, int count) const;

    // 창 안에서의 비율 (창이 비면 0)
    double recentRate(ErrorCategory category) const;

private:
    std::size_t window_;
    int total_errors_ = 0;
    std::map<ErrorCategory, int> by_category_;
    std::deque<ErrorCategory> recent_;
};

} // namespace resilience
} // namespace dcabot
