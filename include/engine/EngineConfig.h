#pragma once

#include "resilience/CircuitBreaker.h"
#include "resilience/RecoveryHandler.h"

#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace dcabot {
namespace engine {

enum class VenueEnvironment { MAINNET, TESTNET, DEMO };

struct ExchangeSettings {
    VenueEnvironment environment = VenueEnvironment::DEMO;
    std::string category = "linear";
    std::string symbol = "BTCUSDT";
    std::string settle_coin = "USDT";
    int recv_window_ms = 5000;
    int request_timeout_seconds = 30;
};

struct StrategySettings {
    std::string interval = "5m";
    double base_amount = 40.0;          // 첫 진입 금액 (USDT)
    double max_multiplier = 3.0;        // 레벨별 증액 상한
    int max_dca_levels = 10;
    double leverage_assumption = 10.0;  // 증거금 = 명목가 / 레버리지
    int kline_limit = 200;
    int min_klines = 70;
};

struct SpacingSettings {
    std::string strategy = "fixed";     // fixed | volatility_adaptive
    nlohmann::json parameters = nlohmann::json::object();
};

struct ClassifierSettings {
    double min_profit = 0.001;          // 평균가 대비 최소 +0.1%
    double max_profit = 0.15;           // 최대 +15%
    double max_position_share = 0.70;   // 전량 청산 주문 제외
};

struct TakeProfitSettings {
    bool enabled = true;
    int levels = 5;
    double level_fraction = 0.20;
    double base_percent = 0.02;
    bool cancel_orphaned_orders = true;
    int placement_budget_seconds = 90;
    int safety_margin_seconds = 10;
    ClassifierSettings classifier;
};

struct DynamicTakeProfitSettings {
    bool enabled = false;
    std::string strategy = "volatility";
    double base_percent = 0.02;
    double multiplier = 1.0;
    double min_percent = 0.005;
    double max_percent = 0.05;
    int atr_period = 14;
};

// 작업 분류 하나의 토큰 버킷 + 차단기 설정
struct OperationClassSettings {
    int capacity = 10;
    int refill_per_second = 10;
    resilience::CircuitBreakerConfig breaker;
};

struct ResilienceSettings {
    std::map<std::string, OperationClassSettings> classes = {
        {"trading", {10, 10, {}}},
        {"market_data", {50, 50, {}}},
        {"account_data", {20, 20, {}}},
    };
    resilience::RecoveryConfig recovery;
};

struct ShutdownSettings {
    int timeout_seconds = 30;
    bool close_position_on_exit = true;
};

struct LogSettings {
    std::string level = "info";
    std::string dir = "logs";
};

struct EngineConfig {
    ExchangeSettings exchange;
    StrategySettings strategy;
    SpacingSettings spacing;
    TakeProfitSettings take_profit;
    DynamicTakeProfitSettings dynamic_tp;
    ResilienceSettings resilience;
    ShutdownSettings shutdown;
    LogSettings logging;
};

inline const char* toString(VenueEnvironment environment) {
    switch (environment) {
        case VenueEnvironment::MAINNET: return "mainnet";
        case VenueEnvironment::TESTNET: return "testnet";
        case VenueEnvironment::DEMO: return "demo";
    }
    return "unknown";
}

} // namespace engine
} // namespace dcabot
