#include "exchange/BybitVenue.h"
#include "common/IntervalClock.h"
#include "common/Logger.h"
#include "common/NumberUtils.h"
#include "network/BybitHttpClient.h"
#include "resilience/BotError.h"

#include <algorithm>

namespace dcabot {
namespace exchange {

using resilience::BotError;
using resilience::ErrorCategory;

namespace {
constexpr int kOrderNotFound = 110001;

// Bybit 는 수치를 문자열로 준다. 숫자로 오는 경우도 문자열로 통일.
std::string field(const nlohmann::json& node, const char* key) {
    if (!node.is_object() || !node.contains(key) || node[key].is_null()) {
        return "";
    }
    const auto& v = node[key];
    return v.is_string() ? v.get<std::string>() : v.dump();
}

const nlohmann::json& resultList(const nlohmann::json& result, const std::string& operation) {
    if (!result.contains("list") || !result["list"].is_array()) {
        throw BotError(ErrorCategory::TEMPORARY, operation + ": response has no list");
    }
    return result["list"];
}

OrderSide parseSide(const std::string& side) {
    return side == "Sell" ? OrderSide::SELL : OrderSide::BUY;
}

OrderType parseType(const std::string& type) {
    return type == "Market" ? OrderType::MARKET : OrderType::LIMIT;
}
}

BybitVenue::BybitVenue(std::shared_ptr<network::IHttpClient> http_client)
    : http_client_(std::move(http_client)) {}

std::string BybitVenue::baseUrlFor(engine::VenueEnvironment environment) {
    switch (environment) {
        case engine::VenueEnvironment::MAINNET: return "https://api.bybit.com";
        case engine::VenueEnvironment::TESTNET: return "https://api-testnet.bybit.com";
        case engine::VenueEnvironment::DEMO: return "https://api-demo.bybit.com";
    }
    return "https://api-demo.bybit.com";
}

void BybitVenue::connect() {
    auto result = network::unwrapBybitResult(http_client_->get("/v5/market/time"), "connect");
    LOG_INFO("Connected to Bybit (server time {})", field(result, "timeSecond"));
}

void BybitVenue::disconnect() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    constraints_cache_.clear();
    LOG_INFO("Disconnected from Bybit");
}

std::vector<VenuePosition> BybitVenue::getPositions(
    const std::string& category, const std::string& symbol
) {
    auto result = network::unwrapBybitResult(
        http_client_->get("/v5/position/list", {{"category", category}, {"symbol", symbol}}, true),
        "getPositions");

    std::vector<VenuePosition> positions;
    for (const auto& item : resultList(result, "getPositions")) {
        VenuePosition pos;
        pos.symbol = field(item, "symbol");
        pos.side = field(item, "side");
        pos.size = field(item, "size");
        pos.position_value = field(item, "positionValue");
        pos.avg_price = field(item, "avgPrice");
        pos.mark_price = field(item, "markPrice");
        pos.unrealised_pnl = field(item, "unrealisedPnl");
        positions.push_back(std::move(pos));
    }
    return positions;
}

std::vector<VenueOrder> BybitVenue::getOpenOrders(
    const std::string& category, const std::string& symbol
) {
    auto result = network::unwrapBybitResult(
        http_client_->get("/v5/order/realtime",
                          {{"category", category}, {"symbol", symbol}, {"openOnly", "0"}}, true),
        "getOpenOrders");

    std::vector<VenueOrder> orders;
    for (const auto& item : resultList(result, "getOpenOrders")) {
        VenueOrder order;
        order.order_id = field(item, "orderId");
        order.symbol = field(item, "symbol");
        order.side = parseSide(field(item, "side"));
        order.type = parseType(field(item, "orderType"));
        order.price = field(item, "price");
        order.quantity = field(item, "qty");
        order.reduce_only = item.value("reduceOnly", false);
        orders.push_back(std::move(order));
    }
    return orders;
}

OrderResult BybitVenue::placeOrder(const OrderRequest& request) {
    nlohmann::json body;
    body["category"] = request.category;
    body["symbol"] = request.symbol;
    body["side"] = toString(request.side);
    body["orderType"] = toString(request.type);
    body["qty"] = request.quantity;
    if (request.type == OrderType::LIMIT) {
        if (!request.price) {
            throw BotError(ErrorCategory::VALIDATION, "limit order requires a price");
        }
        body["price"] = *request.price;
        body["timeInForce"] = "GTC";
    }
    if (request.reduce_only) {
        body["reduceOnly"] = true;
    }

    auto result = network::unwrapBybitResult(http_client_->post("/v5/order/create", body), "placeOrder");

    OrderResult order;
    order.order_id = field(result, "orderId");
    order.status = "New";
    if (order.order_id.empty()) {
        throw BotError(ErrorCategory::ORDER, "placeOrder: venue returned no order id");
    }

    if (request.type == OrderType::MARKET) {
        fillExecutionDetails(request, order);
    }
    return order;
}

void BybitVenue::fillExecutionDetails(const OrderRequest& request, OrderResult& result) {
    try {
        auto detail = network::unwrapBybitResult(
            http_client_->get("/v5/order/realtime",
                              {{"category", request.category},
                               {"symbol", request.symbol},
                               {"orderId", result.order_id}}, true),
            "getOrder");
        const auto& list = resultList(detail, "getOrder");
        if (!list.empty()) {
            result.status = field(list[0], "orderStatus");
            result.cum_exec_qty = field(list[0], "cumExecQty");
            result.cum_exec_value = field(list[0], "cumExecValue");
            result.avg_price = field(list[0], "avgPrice");
        }
    } catch (const BotError& e) {
        // 체결 상세는 다음 포지션 동기화가 보정
        LOG_WARN("Order {} placed but execution details unavailable: {}", result.order_id, e.what());
    }
}

void BybitVenue::cancelOrder(const std::string& category, const std::string& symbol,
                             const std::string& order_id) {
    nlohmann::json body;
    body["category"] = category;
    body["symbol"] = symbol;
    body["orderId"] = order_id;

    try {
        network::unwrapBybitResult(http_client_->post("/v5/order/cancel", body), "cancelOrder");
    } catch (const BotError& e) {
        if (e.code() == kOrderNotFound) {
            LOG_DEBUG("Order {} already gone on venue", order_id);
            return;
        }
        throw;
    }
}

double BybitVenue::getLatestPrice(const std::string& category, const std::string& symbol) {
    auto result = network::unwrapBybitResult(
        http_client_->get("/v5/market/tickers", {{"category", category}, {"symbol", symbol}}),
        "getLatestPrice");
    const auto& list = resultList(result, "getLatestPrice");
    if (list.empty()) {
        throw BotError(ErrorCategory::VALIDATION, "getLatestPrice: no ticker for " + symbol);
    }
    return common::parseDecimal(field(list[0], "lastPrice"), "lastPrice");
}

TradingConstraints BybitVenue::getTradingConstraints(
    const std::string& category, const std::string& symbol
) {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = constraints_cache_.find(category + ":" + symbol);
        if (it != constraints_cache_.end()) {
            return it->second;
        }
    }

    auto result = network::unwrapBybitResult(
        http_client_->get("/v5/market/instruments-info", {{"category", category}, {"symbol", symbol}}),
        "getTradingConstraints");
    const auto& list = resultList(result, "getTradingConstraints");
    if (list.empty()) {
        throw BotError(ErrorCategory::VALIDATION, "getTradingConstraints: unknown symbol " + symbol);
    }

    const auto& info = list[0];
    const auto lot = info.value("lotSizeFilter", nlohmann::json::object());
    const auto price = info.value("priceFilter", nlohmann::json::object());
    const auto leverage = info.value("leverageFilter", nlohmann::json::object());

    TradingConstraints constraints;
    constraints.min_order_qty = common::tryParseDecimal(field(lot, "minOrderQty")).value_or(0.0);
    constraints.max_order_qty = common::tryParseDecimal(field(lot, "maxOrderQty")).value_or(0.0);
    // spot 은 qtyStep 대신 basePrecision, minNotionalValue 대신 minOrderAmt
    constraints.qty_step = common::tryParseDecimal(field(lot, "qtyStep"))
        .value_or(common::tryParseDecimal(field(lot, "basePrecision")).value_or(0.0));
    constraints.min_order_value = common::tryParseDecimal(field(lot, "minNotionalValue"))
        .value_or(common::tryParseDecimal(field(lot, "minOrderAmt")).value_or(0.0));
    constraints.tick_size = common::tryParseDecimal(field(price, "tickSize")).value_or(0.0);
    constraints.max_leverage = common::tryParseDecimal(field(leverage, "maxLeverage")).value_or(1.0);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    constraints_cache_[category + ":" + symbol] = constraints;
    return constraints;
}

std::vector<Candle> BybitVenue::getKlines(const std::string& category, const std::string& symbol,
                                          const std::string& interval, int limit) {
    auto result = network::unwrapBybitResult(
        http_client_->get("/v5/market/kline",
                          {{"category", category},
                           {"symbol", symbol},
                           {"interval", common::normalizeInterval(interval)},
                           {"limit", std::to_string(limit)}}),
        "getKlines");

    std::vector<Candle> candles;
    for (const auto& row : resultList(result, "getKlines")) {
        if (!row.is_array() || row.size() < 6) {
            continue;
        }
        auto at = [&row](size_t i) {
            return row[i].is_string() ? row[i].get<std::string>() : row[i].dump();
        };
        candles.emplace_back(
            common::parseDecimal(at(1), "open"),
            common::parseDecimal(at(2), "high"),
            common::parseDecimal(at(3), "low"),
            common::parseDecimal(at(4), "close"),
            common::parseDecimal(at(5), "volume"),
            static_cast<long long>(common::parseDecimal(at(0), "start"))
        );
    }
    // 응답은 최신 캔들이 먼저
    std::reverse(candles.begin(), candles.end());
    return candles;
}

double BybitVenue::getTradableBalance(const std::string& coin) {
    auto result = network::unwrapBybitResult(
        http_client_->get("/v5/account/wallet-balance",
                          {{"accountType", "UNIFIED"}, {"coin", coin}}, true),
        "getTradableBalance");
    const auto& list = resultList(result, "getTradableBalance");
    if (list.empty()) {
        return 0.0;
    }

    const auto& account = list[0];
    if (auto total = common::tryParseDecimal(field(account, "totalAvailableBalance"))) {
        return *total;
    }
    for (const auto& c : account.value("coin", nlohmann::json::array())) {
        if (field(c, "coin") == coin) {
            if (auto available = common::tryParseDecimal(field(c, "availableToWithdraw"))) {
                return *available;
            }
            return common::tryParseDecimal(field(c, "walletBalance")).value_or(0.0);
        }
    }
    return 0.0;
}

} // namespace exchange
} // namespace dcabot
