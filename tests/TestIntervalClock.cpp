#include "common/IntervalClock.h"

#include <cassert>
#include <chrono>
#include <iostream>

using namespace dcabot::common;
using namespace std::chrono;

int main() {
    assert(normalizeInterval("5m") == "5");
    assert(normalizeInterval("15m") == "15");
    assert(normalizeInterval("1h") == "60");
    assert(normalizeInterval("4h") == "240");
    assert(normalizeInterval("1d") == "D");
    assert(normalizeInterval("D") == "D");
    assert(normalizeInterval("60") == "60");

    assert(isSupportedInterval("5m"));
    assert(isSupportedInterval("240"));
    assert(isSupportedInterval("1d"));
    assert(!isSupportedInterval("abc"));
    assert(!isSupportedInterval("0m"));
    assert(!isSupportedInterval(""));

    assert(intervalDuration("5m") == minutes(5));
    assert(intervalDuration("1h") == hours(1));
    assert(intervalDuration("1d") == hours(24));
    assert(intervalDuration("garbage") == minutes(5));

    // 경계 정렬
    {
        // 2023-11-14 22:13:20 UTC = 1700000000s
        const system_clock::time_point base{seconds(1700000000)};
        // 1700000000 % 300 = 200 -> 다음 5분 경계까지 100초
        assert(timeUntilNextBoundary("5m", base) == milliseconds(100000));
        assert(timeUntilNextBoundary("5m", base + milliseconds(99500)) == milliseconds(500));

        // 경계 위에서는 한 주기 전체
        const system_clock::time_point on_boundary{seconds(1700000100)};
        assert(timeUntilNextBoundary("5m", on_boundary) == milliseconds(300000));

        // 1700000000 % 3600 = 800
        assert(timeUntilNextBoundary("1h", base) == milliseconds(2800000));
    }

    std::cout << "[TEST] IntervalClock PASSED\n";
    return 0;
}
