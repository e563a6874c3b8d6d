#include "core/orchestration/LoopCoordinator.h"
#include "analytics/TechnicalIndicators.h"
#include "common/IntervalClock.h"
#include "common/Logger.h"
#include "common/NumberUtils.h"

#include <future>
#include <sstream>
#include <iomanip>

namespace dcabot {
namespace core {

namespace {

// 정리 스레드가 코디네이터보다 오래 살 수 있으므로 필요한 것만 복사해 간다
struct CleanupContext {
    std::shared_ptr<exchange::IVenue> venue;
    std::shared_ptr<sync::StateSynchronizer> synchronizer;
    std::shared_ptr<execution::TakeProfitManager> take_profit;
    std::string category;
    std::string symbol;
    bool take_profit_enabled = true;
    bool close_position = true;
};

void flattenPosition(const CleanupContext& ctx) {
    const auto positions = ctx.venue->getPositions(ctx.category, ctx.symbol);

    for (const auto& pos : positions) {
        if (pos.symbol != ctx.symbol || pos.side != "Buy") {
            continue;
        }
        const auto size = common::tryParseDecimal(pos.size);
        if (!size || *size <= 0.0) {
            continue;
        }

        LOG_WARN("Closing position on exit: {} {} (value {})", pos.size, pos.symbol, pos.position_value);

        OrderRequest request;
        request.category = ctx.category;
        request.symbol = ctx.symbol;
        request.side = OrderSide::SELL;
        request.type = OrderType::MARKET;
        request.quantity = pos.size;
        request.reduce_only = true;

        const OrderResult result = ctx.venue->placeOrder(request);

        double price = common::tryParseDecimal(result.avg_price).value_or(0.0);
        if (price <= 0.0) {
            price = common::tryParseDecimal(pos.mark_price).value_or(0.0);
        }
        Logger::getInstance().logTrade(ctx.symbol, "Sell", price, *size, result.order_id, "shutdown_close");
        LOG_INFO("Position closed: order {}", result.order_id);
    }

    ctx.synchronizer->reset();
}

// 익절 레그와 포지션이 모두 정리됐으면 true
bool runCleanup(const CleanupContext& ctx) {
    bool complete = true;

    if (ctx.take_profit_enabled) {
        try {
            ctx.take_profit->cancelAll();
        } catch (const std::exception& e) {
            complete = false;
            LOG_ERROR("Failed to cancel take-profit orders on exit: {}", e.what());
        }
    }

    if (ctx.close_position) {
        try {
            flattenPosition(ctx);
        } catch (const std::exception& e) {
            complete = false;
            LOG_ERROR("Failed to close position on exit: {}", e.what());
        }
    }

    try {
        ctx.venue->disconnect();
    } catch (const std::exception& e) {
        LOG_WARN("Disconnect failed: {}", e.what());
    }
    return complete;
}

} // namespace

const char* toString(ShutdownResult result) {
    return result == ShutdownResult::GRACEFUL ? "graceful" : "forced";
}

LoopCoordinator::LoopCoordinator(const engine::EngineConfig& config, LoopComponents components)
    : config_(config)
    , components_(std::move(components))
    , sizer_(config.strategy) {
    if (!components_.venue || !components_.synchronizer || !components_.take_profit ||
        !components_.entry_gate || !components_.signal || !components_.recovery) {
        throw resilience::BotError(resilience::ErrorCategory::VALIDATION,
                                   "loop coordinator is missing a component");
    }
    if (!components_.stop_signal) {
        components_.stop_signal = std::make_shared<common::StopSignal>();
    }
    if (!components_.cleanup_signal) {
        components_.cleanup_signal = std::make_shared<common::StopSignal>();
    }

    // 외부 청산 -> 익절 추적 초기화
    auto take_profit = components_.take_profit;
    components_.synchronizer->setResyncCallback([take_profit]() {
        LOG_WARN("Position closed outside the bot, clearing take-profit tracking");
        take_profit->clearTracking();
    });
}

LoopCoordinator::~LoopCoordinator() {
    if (worker_thread_ && worker_thread_->joinable()) {
        components_.stop_signal->requestStop();
        worker_thread_->join();
    }
}

bool LoopCoordinator::start() {
    if (running_ || worker_thread_) {
        LOG_WARN("Loop coordinator already started");
        return false;
    }
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&LoopCoordinator::run, this);
    return true;
}

void LoopCoordinator::initialize() {
    const auto& ex = config_.exchange;
    auto& c = components_;

    LOG_INFO("Connecting to {} ({} {})", engine::toString(ex.environment), ex.category, ex.symbol);
    c.venue->connect();

    const double balance = c.synchronizer->syncBalance(ex.settle_coin);
    c.synchronizer->syncPosition();
    const auto snapshot = c.synchronizer->snapshot();

    LOG_INFO("Startup state: balance {:.2f} {}, position {} @ {:.4f}, DCA level {}",
             balance, ex.settle_coin, snapshot.size, snapshot.avg_price, snapshot.dca_level);

    if (!config_.take_profit.enabled) {
        return;
    }

    try {
        const int orphaned = c.take_profit->cancelOrphanedOrders(snapshot.avg_price, snapshot.size);
        if (orphaned > 0) {
            LOG_INFO("Cancelled {} orphaned take-profit orders", orphaned);
        }
        if (snapshot.isOpen()) {
            strategy::MarketContext context;
            context.average_price = snapshot.avg_price;
            c.take_profit->placeAll(snapshot.size, snapshot.avg_price, context);
        }
    } catch (const resilience::BotError& e) {
        if (e.isFatal()) {
            throw;
        }
        reportError("startup take-profit", e);
    }
}

void LoopCoordinator::run() {
    running_ = true;
    auto stop = components_.stop_signal;
    const std::string interval = config_.strategy.interval;

    LOG_INFO("Main loop started (interval {})", interval);

    while (!stop->stopRequested()) {
        const auto wait = common::timeUntilNextBoundary(interval);
        LOG_DEBUG("Next cycle in {} ms", wait.count());
        if (stop->waitFor(wait)) {
            break;
        }
        runCycle();
    }

    running_ = false;
    LOG_INFO("Main loop stopped");
}

CycleReport LoopCoordinator::runCycle() {
    CycleReport report;
    if (halted_) {
        report.status = "halted";
        return report;
    }

    try {
        report = executeCycle();
        credential_failures_ = 0;
    } catch (const resilience::OperationCancelled& e) {
        LOG_INFO("Cycle interrupted: {}", e.what());
    } catch (const resilience::BotError& e) {
        reportError("cycle", e);
        if (e.category() == resilience::ErrorCategory::CREDENTIALS) {
            noteCredentialFailure();
        }
    } catch (const std::exception& e) {
        reportError("cycle", e);
    } catch (...) {
        LOG_ERROR("Cycle aborted by unknown fault");
        errors_.tryPush("cycle: unknown fault");
    }

    cycle_count_++;
    return report;
}

CycleReport LoopCoordinator::executeCycle() {
    const auto& ex = config_.exchange;
    auto& c = components_;
    CycleReport report;

    // 1. 잔고/포지션 갱신. 실패하면 이전 값으로 진행.
    try {
        c.synchronizer->syncBalance(ex.settle_coin);
    } catch (const resilience::BotError& e) {
        if (e.isFatal()) throw;
        reportError("syncBalance", e);
    }
    try {
        c.synchronizer->syncPosition();
    } catch (const resilience::BotError& e) {
        if (e.isFatal()) throw;
        reportError("syncPosition", e);
    }

    const double price = c.venue->getLatestPrice(ex.category, ex.symbol);

    std::vector<Candle> candles;
    try {
        candles = c.venue->getKlines(ex.category, ex.symbol, config_.strategy.interval,
                                     config_.strategy.kline_limit);
    } catch (const resilience::BotError& e) {
        if (e.isFatal()) throw;
        reportError("getKlines", e);
    }

    // 2. 익절 체결 감지
    if (config_.take_profit.enabled) {
        try {
            const auto fills = c.take_profit->detectFills();
            report.filled_legs = static_cast<int>(fills.size());
            if (!fills.empty()) {
                c.synchronizer->syncPosition();
            }
        } catch (const resilience::BotError& e) {
            if (e.isFatal()) throw;
            reportError("detectFills", e);
        }
    }

    // 3. 신호 + 게이트 + 진입
    PositionSnapshot snapshot = c.synchronizer->snapshot();
    if (candles.size() < static_cast<std::size_t>(config_.strategy.min_klines)) {
        LOG_WARN("Not enough klines ({} < {}), entry skipped",
                 candles.size(), config_.strategy.min_klines);
    } else {
        report.entered = tryEnter(snapshot, price, candles, report);
        if (report.entered) {
            snapshot = c.synchronizer->snapshot();
        }
    }

    // 4. 익절 레그 정리
    if (config_.take_profit.enabled) {
        try {
            reconcileTakeProfit(snapshot, candles, price, report.entered);
        } catch (const resilience::BotError& e) {
            if (e.isFatal()) throw;
            reportError("takeProfit", e);
        }
    }

    // 5. 상태 출력
    report.status = buildStatusLine(c.synchronizer->snapshot(), price);
    LOG_INFO("{}", report.status);
    report.completed = true;
    return report;
}

bool LoopCoordinator::tryEnter(const PositionSnapshot& snapshot, double price,
                               const std::vector<Candle>& candles, CycleReport& report) {
    const auto& ex = config_.exchange;
    auto& c = components_;

    if (!c.signal->shouldEnter(candles, price)) {
        return false;
    }

    strategy::MarketContext context;
    context.current_price = price;
    context.average_price = snapshot.avg_price;
    context.price_history = analytics::TechnicalIndicators::extractClosePrices(candles);
    context.candles = candles;

    const auto decision = c.entry_gate->evaluate(snapshot.dca_level, snapshot.avg_price, price, context);
    if (!decision.allowed) {
        report.gate_blocked = true;
        LOG_INFO("Entry {}", decision.reason);
        return false;
    }

    const TradingConstraints constraints = c.venue->getTradingConstraints(ex.category, ex.symbol);
    const auto plan = sizer_.plan(snapshot.dca_level, price, snapshot.balance, constraints);
    if (!plan.valid) {
        LOG_WARN("Entry skipped: {} (level {}, balance {:.2f})",
                 plan.reason, snapshot.dca_level, snapshot.balance);
        return false;
    }

    OrderRequest request;
    request.category = ex.category;
    request.symbol = ex.symbol;
    request.side = OrderSide::BUY;
    request.type = OrderType::MARKET;
    request.quantity = plan.quantity_text;

    LOG_INFO("Placing DCA entry: level {} amount {:.2f} qty {} @ ~{}",
             snapshot.dca_level + 1, plan.amount, plan.quantity_text, price);

    const OrderResult result = c.recovery->executeFor(
        "coordinator", "placeEntry", [&]() { return c.venue->placeOrder(request); });

    double fill_price = common::tryParseDecimal(result.avg_price).value_or(0.0);
    if (fill_price <= 0.0) {
        fill_price = price;
    }
    const int level = c.synchronizer->recordEntry();
    Logger::getInstance().logTrade(ex.symbol, "Buy", fill_price, plan.quantity,
                                   result.order_id, "dca_level_" + std::to_string(level));
    LOG_INFO("DCA entry filled: level {} order {}", level, result.order_id);

    try {
        c.synchronizer->syncPosition();
    } catch (const resilience::BotError& e) {
        if (e.isFatal()) throw;
        reportError("syncPosition after entry", e);
    }
    return true;
}

void LoopCoordinator::reconcileTakeProfit(const PositionSnapshot& snapshot,
                                          const std::vector<Candle>& candles,
                                          double price, bool entered) {
    auto& tp = components_.take_profit;

    if (!snapshot.isOpen()) {
        if (tp->liveLegCount() > 0) {
            tp->cancelAll();
        }
        return;
    }

    strategy::MarketContext context;
    context.current_price = price;
    context.average_price = snapshot.avg_price;
    context.candles = candles;

    if (entered) {
        // 두 번째 진입부터는 평균가가 바뀌므로 전체 재배치
        if (snapshot.dca_level >= 2) {
            tp->updateAll(snapshot.avg_price, context);
        } else {
            tp->placeAll(snapshot.size, snapshot.avg_price, context);
        }
        return;
    }

    if (tp->liveLegCount() == 0) {
        LOG_INFO("Open position has no take-profit legs, placing");
        tp->placeAll(snapshot.size, snapshot.avg_price, context);
    }
}

std::string LoopCoordinator::buildStatusLine(const PositionSnapshot& snapshot, double price) const {
    std::ostringstream oss;
    oss << std::fixed;
    oss << "[" << config_.exchange.symbol << "] price=" << std::setprecision(4) << price;
    if (snapshot.isOpen()) {
        const double pnl = (price - snapshot.avg_price) / snapshot.avg_price * 100.0;
        oss << " size=" << std::setprecision(6) << snapshot.size
            << " avg=" << std::setprecision(4) << snapshot.avg_price
            << " level=" << snapshot.dca_level
            << " pnl=" << std::setprecision(2) << pnl << "%"
            << " tp_legs=" << components_.take_profit->liveLegCount();
    } else {
        oss << " position=flat level=" << snapshot.dca_level;
    }
    oss << " balance=" << std::setprecision(2) << snapshot.balance;
    return oss.str();
}

void LoopCoordinator::reportError(const std::string& stage, const std::exception& e) {
    LOG_ERROR("{} failed: {}", stage, e.what());
    if (!errors_.tryPush(stage + ": " + e.what())) {
        LOG_WARN("Error queue full, dropped report from {}", stage);
    }
}

void LoopCoordinator::noteCredentialFailure() {
    credential_failures_++;
    LOG_ERROR("Credential failure {}/{}", credential_failures_, kMaxCredentialFailures);
    if (credential_failures_ >= kMaxCredentialFailures) {
        LOG_ERROR("Repeated credential failures, halting trading");
        halted_ = true;
        components_.stop_signal->requestStop();
    }
}

ShutdownResult LoopCoordinator::stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (stopped_) {
        return shutdown_result_;
    }
    stopped_ = true;

    LOG_INFO("Stopping loop coordinator");
    components_.stop_signal->requestStop();

    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    running_ = false;

    auto context = std::make_shared<CleanupContext>();
    context->venue = components_.venue;
    context->synchronizer = components_.synchronizer;
    context->take_profit = components_.take_profit;
    context->category = config_.exchange.category;
    context->symbol = config_.exchange.symbol;
    context->take_profit_enabled = config_.take_profit.enabled;
    context->close_position = config_.shutdown.close_position_on_exit;

    auto done = std::make_shared<std::promise<bool>>();
    std::future<bool> finished = done->get_future();

    std::thread cleaner([context, done]() {
        bool complete = false;
        try {
            complete = runCleanup(*context);
        } catch (...) {
            LOG_ERROR("Cleanup aborted by unknown fault");
        }
        done->set_value(complete);
    });

    const auto timeout = std::chrono::seconds(config_.shutdown.timeout_seconds);
    if (finished.wait_for(timeout) == std::future_status::ready) {
        cleaner.join();
        if (finished.get()) {
            shutdown_result_ = ShutdownResult::GRACEFUL;
            LOG_INFO("Shutdown completed gracefully");
        } else {
            shutdown_result_ = ShutdownResult::FORCED;
            LOG_ERROR("Shutdown cleanup incomplete, take-profit orders or position may remain on venue");
        }
    } else {
        // 남은 토큰 대기를 끊는다. 진행 중인 HTTP 요청은 자체 시한까지 간다.
        components_.cleanup_signal->requestStop();
        cleaner.detach();
        shutdown_result_ = ShutdownResult::FORCED;
        LOG_ERROR("Shutdown cleanup exceeded {}s, forcing exit", config_.shutdown.timeout_seconds);
    }
    return shutdown_result_;
}

} // namespace core
} // namespace dcabot
