#include "common/Config.h"
#include "common/IntervalClock.h"
#include "common/NumberUtils.h"
#include "common/PathUtils.h"
#include "resilience/BotError.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace dcabot {

namespace {
std::string readEnvVar(const char* name) {
    const char* value = std::getenv(name);
    return value ? common::trimCopy(value) : "";
}

engine::VenueEnvironment parseEnvironment(const std::string& name) {
    if (name == "mainnet") return engine::VenueEnvironment::MAINNET;
    if (name == "testnet") return engine::VenueEnvironment::TESTNET;
    if (name == "demo") return engine::VenueEnvironment::DEMO;
    throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                               "invalid exchange.environment: " + name);
}

std::chrono::milliseconds secondsField(const nlohmann::json& j, const char* key,
                                       std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    return std::chrono::milliseconds(static_cast<long long>(j[key].get<double>() * 1000.0));
}

std::chrono::milliseconds millisField(const nlohmann::json& j, const char* key,
                                      std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    return std::chrono::milliseconds(j[key].get<long long>());
}

void applyOperationClass(const nlohmann::json& j, engine::OperationClassSettings& out) {
    out.capacity = j.value("capacity", out.capacity);
    out.refill_per_second = j.value("refill_per_second", out.refill_per_second);
    out.breaker.failure_threshold = j.value("failure_threshold", out.breaker.failure_threshold);
    out.breaker.success_threshold = j.value("success_threshold", out.breaker.success_threshold);
    out.breaker.max_failures = j.value("max_failures", out.breaker.max_failures);
    out.breaker.timeout = secondsField(j, "timeout_seconds", out.breaker.timeout);
    out.breaker.reset_timeout = secondsField(j, "reset_timeout_seconds", out.breaker.reset_timeout);
}

void requireThat(bool condition, const std::string& message) {
    if (!condition) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION, "invalid config: " + message);
    }
}
}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::load(const std::string& path) {
    std::filesystem::path config_path;
    if (std::filesystem::path(path).is_absolute()) {
        config_path = path;
    } else {
        config_path = utils::PathUtils::resolveRelativePath(path);
        if (!std::filesystem::exists(config_path) && std::filesystem::exists(path)) {
            config_path = std::filesystem::absolute(path);
        }
    }

    std::cout << "Config file: " << config_path << std::endl;

    api_key_ = readEnvVar("BYBIT_API_KEY");
    api_secret_ = readEnvVar("BYBIT_API_SECRET");
    if (!hasCredentials()) {
        std::cout << "Warning: BYBIT_API_KEY or BYBIT_API_SECRET is empty." << std::endl;
    }

    if (!std::filesystem::exists(config_path)) {
        std::cout << "Warning: config file not found, using defaults." << std::endl;
        return;
    }

    std::ifstream file(config_path);
    if (!file.is_open()) {
        std::cout << "Warning: config file could not be opened, using defaults." << std::endl;
        return;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   std::string("invalid config json: ") + e.what());
    }
    loadFromJson(j);
}

void Config::loadFromJson(const nlohmann::json& j) {
    auto& cfg = engine_config_;

    if (j.contains("api")) {
        const auto& api = j["api"];
        if (!api.value("key", std::string()).empty() || !api.value("secret", std::string()).empty()) {
            std::cout << "Warning: api keys in the config file are ignored. "
                      << "Use BYBIT_API_KEY / BYBIT_API_SECRET." << std::endl;
        }
    }

    if (j.contains("exchange")) {
        const auto& e = j["exchange"];
        if (e.contains("environment")) {
            cfg.exchange.environment = parseEnvironment(e["environment"].get<std::string>());
        }
        cfg.exchange.category = e.value("category", cfg.exchange.category);
        cfg.exchange.symbol = e.value("symbol", cfg.exchange.symbol);
        cfg.exchange.settle_coin = e.value("settle_coin", cfg.exchange.settle_coin);
        cfg.exchange.recv_window_ms = e.value("recv_window_ms", cfg.exchange.recv_window_ms);
        cfg.exchange.request_timeout_seconds =
            e.value("request_timeout_seconds", cfg.exchange.request_timeout_seconds);
    }

    if (j.contains("strategy")) {
        const auto& s = j["strategy"];
        cfg.strategy.interval = s.value("interval", cfg.strategy.interval);
        cfg.strategy.base_amount = s.value("base_amount", cfg.strategy.base_amount);
        cfg.strategy.max_multiplier = s.value("max_multiplier", cfg.strategy.max_multiplier);
        cfg.strategy.max_dca_levels = s.value("max_dca_levels", cfg.strategy.max_dca_levels);
        cfg.strategy.leverage_assumption = s.value("leverage_assumption", cfg.strategy.leverage_assumption);
        cfg.strategy.kline_limit = s.value("kline_limit", cfg.strategy.kline_limit);
        cfg.strategy.min_klines = s.value("min_klines", cfg.strategy.min_klines);
    }

    if (j.contains("spacing")) {
        const auto& sp = j["spacing"];
        cfg.spacing.strategy = sp.value("strategy", cfg.spacing.strategy);
        if (sp.contains("parameters") && sp["parameters"].is_object()) {
            cfg.spacing.parameters = sp["parameters"];
        }
    }

    if (j.contains("take_profit")) {
        const auto& tp = j["take_profit"];
        cfg.take_profit.enabled = tp.value("enabled", cfg.take_profit.enabled);
        cfg.take_profit.levels = tp.value("levels", cfg.take_profit.levels);
        cfg.take_profit.level_fraction = tp.value("level_fraction", cfg.take_profit.level_fraction);
        cfg.take_profit.base_percent = tp.value("base_percent", cfg.take_profit.base_percent);
        cfg.take_profit.cancel_orphaned_orders =
            tp.value("cancel_orphaned_orders", cfg.take_profit.cancel_orphaned_orders);
        cfg.take_profit.placement_budget_seconds =
            tp.value("placement_budget_seconds", cfg.take_profit.placement_budget_seconds);
        cfg.take_profit.safety_margin_seconds =
            tp.value("safety_margin_seconds", cfg.take_profit.safety_margin_seconds);
        if (tp.contains("classifier")) {
            const auto& c = tp["classifier"];
            auto& cls = cfg.take_profit.classifier;
            cls.min_profit = c.value("min_profit", cls.min_profit);
            cls.max_profit = c.value("max_profit", cls.max_profit);
            cls.max_position_share = c.value("max_position_share", cls.max_position_share);
        }
    }

    if (j.contains("dynamic_tp")) {
        const auto& d = j["dynamic_tp"];
        auto& dyn = cfg.dynamic_tp;
        dyn.enabled = d.value("enabled", dyn.enabled);
        dyn.strategy = d.value("strategy", dyn.strategy);
        dyn.base_percent = d.value("base_percent", dyn.base_percent);
        dyn.multiplier = d.value("multiplier", dyn.multiplier);
        dyn.min_percent = d.value("min_percent", dyn.min_percent);
        dyn.max_percent = d.value("max_percent", dyn.max_percent);
        dyn.atr_period = d.value("atr_period", dyn.atr_period);
    }

    if (j.contains("resilience")) {
        const auto& r = j["resilience"];
        for (auto& [name, settings] : cfg.resilience.classes) {
            if (r.contains(name)) {
                applyOperationClass(r[name], settings);
            }
        }
        if (r.contains("backoff")) {
            const auto& b = r["backoff"];
            auto& rec = cfg.resilience.recovery;
            if (b.contains("strategy")) {
                rec.strategy = resilience::parseBackoffStrategy(b["strategy"].get<std::string>());
            }
            rec.base_delay = millisField(b, "base_delay_ms", rec.base_delay);
            rec.max_delay = millisField(b, "max_delay_ms", rec.max_delay);
            rec.jitter = b.value("jitter", rec.jitter);
        }
    }

    if (j.contains("shutdown")) {
        const auto& sd = j["shutdown"];
        cfg.shutdown.timeout_seconds = sd.value("timeout_seconds", cfg.shutdown.timeout_seconds);
        cfg.shutdown.close_position_on_exit =
            sd.value("close_position_on_exit", cfg.shutdown.close_position_on_exit);
    }

    if (j.contains("logging")) {
        const auto& l = j["logging"];
        cfg.logging.level = l.value("level", cfg.logging.level);
        cfg.logging.dir = l.value("dir", cfg.logging.dir);
    }
}

void Config::validate() const {
    const auto& cfg = engine_config_;

    requireThat(!cfg.exchange.symbol.empty(), "exchange.symbol is empty");
    requireThat(cfg.exchange.request_timeout_seconds > 0, "exchange.request_timeout_seconds must be positive");
    requireThat(common::isSupportedInterval(cfg.strategy.interval),
                "strategy.interval '" + cfg.strategy.interval + "' is not supported");
    requireThat(cfg.strategy.base_amount > 0.0, "strategy.base_amount must be positive");
    requireThat(cfg.strategy.max_multiplier >= 1.0, "strategy.max_multiplier must be >= 1");
    requireThat(cfg.strategy.max_dca_levels >= 1 && cfg.strategy.max_dca_levels <= 100,
                "strategy.max_dca_levels must be within [1, 100]");
    requireThat(cfg.strategy.leverage_assumption > 0.0, "strategy.leverage_assumption must be positive");

    requireThat(cfg.spacing.strategy == "fixed" || cfg.spacing.strategy == "fixed_progressive" ||
                cfg.spacing.strategy == "volatility_adaptive",
                "spacing.strategy '" + cfg.spacing.strategy + "' is unknown");

    const auto& tp = cfg.take_profit;
    requireThat(tp.levels >= 1, "take_profit.levels must be >= 1");
    requireThat(tp.level_fraction > 0.0 && tp.level_fraction <= 1.0,
                "take_profit.level_fraction must be within (0, 1]");
    requireThat(tp.base_percent >= 0.0001 && tp.base_percent <= 1.0,
                "take_profit.base_percent must be within [0.0001, 1]");
    requireThat(tp.placement_budget_seconds > tp.safety_margin_seconds,
                "take_profit.placement_budget_seconds must exceed safety_margin_seconds");
    requireThat(tp.classifier.min_profit < tp.classifier.max_profit,
                "take_profit.classifier.min_profit must be below max_profit");

    if (cfg.dynamic_tp.enabled) {
        requireThat(cfg.dynamic_tp.strategy == "volatility" || cfg.dynamic_tp.strategy == "fixed",
                    "dynamic_tp.strategy '" + cfg.dynamic_tp.strategy + "' is unknown");
        requireThat(cfg.dynamic_tp.min_percent > 0.0 &&
                    cfg.dynamic_tp.min_percent <= cfg.dynamic_tp.max_percent &&
                    cfg.dynamic_tp.max_percent <= 1.0,
                    "dynamic_tp percent range is inconsistent");
        requireThat(cfg.dynamic_tp.atr_period >= 1, "dynamic_tp.atr_period must be >= 1");
    }

    for (const auto& [name, settings] : cfg.resilience.classes) {
        requireThat(settings.capacity >= 1 && settings.refill_per_second >= 1,
                    "resilience." + name + " bucket must be positive");
    }

    requireThat(cfg.shutdown.timeout_seconds >= 1, "shutdown.timeout_seconds must be >= 1");
}

void Config::resetToDefaults() {
    engine_config_ = engine::EngineConfig();
}

} // namespace dcabot
