#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>

namespace dcabot {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Quantity = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { LIMIT, MARKET };
enum class LegStatus { PENDING, FILLED };

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "Buy" : "Sell";
}

inline const char* toString(OrderType type) {
    return type == OrderType::LIMIT ? "Limit" : "Market";
}

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

// 거래소가 보고한 포지션 (문자열 그대로 보관, 파싱은 동기화 쪽에서)
struct VenuePosition {
    std::string symbol;
    std::string side;
    std::string size;
    std::string position_value;
    std::string avg_price;
    std::string mark_price;
    std::string unrealised_pnl;
};

struct VenueOrder {
    std::string order_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::LIMIT;
    std::string price;
    std::string quantity;
    bool reduce_only = false;
};

struct OrderRequest {
    std::string category;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    std::string quantity;
    std::optional<std::string> price;
    bool reduce_only = false;
};

struct OrderResult {
    std::string order_id;
    std::string status;
    std::string cum_exec_qty;
    std::string cum_exec_value;
    std::string avg_price;
};

struct TradingConstraints {
    double min_order_qty = 0.0;
    double max_order_qty = 0.0;
    double qty_step = 0.0;
    double min_order_value = 0.0;
    double tick_size = 0.0;
    double max_leverage = 0.0;
};

// 로컬 포지션 복제본의 시점 스냅샷
struct PositionSnapshot {
    std::string symbol;
    Quantity size = 0.0;
    Amount notional = 0.0;
    Price avg_price = 0.0;
    int dca_level = 0;
    double balance = 0.0;

    bool isOpen() const { return size > 0.0 && avg_price > 0.0; }
};

struct TakeProfitLeg {
    int level = 0;
    Price price = 0.0;
    Quantity quantity = 0.0;
    std::string order_id;
    LegStatus status = LegStatus::PENDING;
};

} // namespace dcabot
