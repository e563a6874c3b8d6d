#pragma once

#include "common/Types.h"

#include <string>
#include <vector>

namespace dcabot {
namespace strategy {

// 진입 신호. 최종 허용 여부는 EntryGate 가 결정한다.
class ISignalSource {
public:
    virtual ~ISignalSource() = default;

    virtual bool shouldEnter(const std::vector<Candle>& candles, double current_price) = 0;
    virtual std::string getName() const = 0;
};

class AlwaysEnterSignal : public ISignalSource {
public:
    bool shouldEnter(const std::vector<Candle>&, double current_price) override {
        return current_price > 0.0;
    }
    std::string getName() const override { return "always_enter"; }
};

} // namespace strategy
} // namespace dcabot
