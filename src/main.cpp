#include "common/Config.h"
#include "common/Logger.h"
#include "common/StopSignal.h"
#include "core/orchestration/LoopCoordinator.h"
#include "exchange/BybitVenue.h"
#include "exchange/GuardedVenue.h"
#include "execution/TakeProfitManager.h"
#include "network/BybitHttpClient.h"
#include "resilience/CircuitBreaker.h"
#include "resilience/RateLimiter.h"
#include "resilience/RecoveryHandler.h"
#include "risk/EntryGate.h"
#include "strategy/ISignalSource.h"
#include "strategy/ISpacingStrategy.h"
#include "strategy/ITakeProfitStrategy.h"
#include "sync/StateSynchronizer.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace dcabot;

// Ctrl+C / SIGTERM 수신 여부. 핸들러에서는 플래그만 세운다.
static volatile std::sig_atomic_t g_signal_received = 0;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_signal_received = 1;
    }
}

int main(int argc, char* argv[]) {
    try {
        const std::string config_path = argc > 1 ? argv[1] : "config/config.json";

        auto& config = Config::getInstance();
        config.load(config_path);
        config.validate();

        Logger::getInstance().initialize(config.getLogDir(), config.getLogLevel());

        const engine::EngineConfig engine_config = config.getEngineConfig();
        const auto& ex = engine_config.exchange;

        LOG_INFO("========================================");
        LOG_INFO("dcabot - {} {} on {}", ex.category, ex.symbol, engine::toString(ex.environment));
        LOG_INFO("========================================");

        if (!config.hasCredentials()) {
            LOG_ERROR("BYBIT_API_KEY / BYBIT_API_SECRET are not set");
            std::cerr << "Missing API credentials (BYBIT_API_KEY / BYBIT_API_SECRET)\n";
            return 1;
        }

        auto stop_signal = std::make_shared<common::StopSignal>();
        auto cleanup_signal = std::make_shared<common::StopSignal>();

        network::BybitClientOptions client_options;
        client_options.base_url = exchange::BybitVenue::baseUrlFor(ex.environment);
        client_options.recv_window_ms = ex.recv_window_ms;
        client_options.timeout_seconds = ex.request_timeout_seconds;
        auto http_client = std::make_shared<network::BybitHttpClient>(
            config.getApiKey(), config.getApiSecret(), client_options);

        auto limiters = std::make_shared<resilience::RateLimiterRegistry>();
        auto breakers = std::make_shared<resilience::CircuitBreakerRegistry>();
        auto venue = std::make_shared<exchange::GuardedVenue>(
            std::make_shared<exchange::BybitVenue>(http_client),
            engine_config.resilience, limiters, breakers, stop_signal, cleanup_signal);

        auto spacing = std::shared_ptr<strategy::ISpacingStrategy>(
            strategy::createSpacingStrategy(engine_config.spacing.strategy,
                                            engine_config.spacing.parameters));
        auto tp_strategy = std::shared_ptr<strategy::ITakeProfitStrategy>(
            strategy::createTakeProfitStrategy(engine_config.take_profit, engine_config.dynamic_tp));

        core::LoopComponents components;
        components.venue = venue;
        components.synchronizer = std::make_shared<sync::StateSynchronizer>(
            venue, ex.category, ex.symbol, engine_config.strategy.base_amount, stop_signal);
        components.take_profit = std::make_shared<execution::TakeProfitManager>(
            venue, ex.category, ex.symbol, engine_config.take_profit, tp_strategy);
        components.entry_gate = std::make_shared<risk::EntryGate>(spacing);
        components.signal = std::make_shared<strategy::AlwaysEnterSignal>();
        components.recovery = std::make_shared<resilience::RecoveryHandler>(
            engine_config.resilience.recovery, stop_signal);
        components.stop_signal = stop_signal;
        components.cleanup_signal = cleanup_signal;

        LOG_INFO("Spacing: {}, take-profit: {} x{} levels",
                 spacing->getName(), tp_strategy->getName(), engine_config.take_profit.levels);

        auto coordinator = std::make_unique<core::LoopCoordinator>(engine_config, components);
        coordinator->initialize();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        if (!coordinator->start()) {
            LOG_ERROR("Failed to start main loop");
            return 1;
        }
        std::cout << "Running. Press Ctrl+C to stop.\n";

        while (!g_signal_received && !stop_signal->stopRequested()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (g_signal_received) {
            LOG_INFO("Shutdown signal received");
        }

        const auto result = coordinator->stop();
        LOG_INFO("Shutdown {} after {} cycles", core::toString(result), coordinator->cycleCount());

        const int exit_code = coordinator->isHalted() ? 2
                            : result == core::ShutdownResult::GRACEFUL ? 0 : 3;
        if (coordinator->isHalted()) {
            LOG_ERROR("Stopped after repeated credential failures");
        }
        if (result == core::ShutdownResult::FORCED) {
            // 분리된 정리 스레드가 아직 로거/베뉴를 쓰고 있을 수 있어 정적 소멸자를 건너뛴다
            Logger::getInstance().flush();
            std::quick_exit(exit_code);
        }
        return exit_code;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
