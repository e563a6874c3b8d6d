#include "resilience/ErrorStats.h"

#include <algorithm>

namespace dcabot {
namespace resilience {

ErrorStats::ErrorStats(std::size_t window)
    : window_(window == 0 ? 1 : window) {}

void ErrorStats::record(ErrorCategory category) {
    total_errors_++;
    by_category_[category]++;

    recent_.push_back(category);
    if (recent_.size() > window_) {
        recent_.pop_front();
    }
}

int ErrorStats::totalErrors(ErrorCategory category) const {
    auto it = by_category_.find(category);
    return it == by_category_.end() ? 0 : it->second;
}

int ErrorStats::recentCount(ErrorCategory category) const {
    return static_cast<int>(std::count(recent_.begin(), recent_.end(), category));
}

bool ErrorStats::hasRecentErrors(ErrorCategory category, int count) const {
    return recentCount(category) >= count;
}

double ErrorStats::recentRate(ErrorCategory category) const {
    if (recent_.empty()) {
        return 0.0;
    }
    return static_cast<double>(recentCount(category)) / static_cast<double>(recent_.size());
}

} // namespace resilience
} // namespace dcabot
