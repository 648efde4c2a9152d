#include "exchange/BybitResponseParser.h"

#include "common/Errors.h"
#include "common/TickSizeHelper.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace spotpilot {
namespace exchange {
namespace bybit {
namespace {
std::string snippet(const std::string& body) {
    constexpr size_t kMax = 256;
    return body.size() <= kMax ? body : body.substr(0, kMax) + "...";
}

std::string stringField(const nlohmann::json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return "";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

const nlohmann::json& listOf(const nlohmann::json& result) {
    static const nlohmann::json kEmpty = nlohmann::json::array();
    auto it = result.find("list");
    if (it == result.end() || !it->is_array()) {
        return kEmpty;
    }
    return *it;
}

double parseNumber(const nlohmann::json& value, double fallback) {
    if (value.is_number()) {
        return value.get<double>();
    }
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.empty()) {
            return fallback;
        }
        try {
            return std::stod(text);
        } catch (const std::exception&) {
            throw InvalidResponse("non-numeric field value: " + text);
        }
    }
    return fallback;
}
}

double toDouble(const nlohmann::json& object, const char* key, double fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    return parseNumber(*it, fallback);
}

int precisionToDecimals(const nlohmann::json& value, int fallback) {
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    if (value.is_number_float()) {
        return common::decimalsForStep(value.get<double>());
    }
    if (value.is_string()) {
        const double step = parseNumber(value, 0.0);
        if (step <= 0.0) {
            return fallback;
        }
        return common::decimalsForStep(step);
    }
    return fallback;
}

OrderSide parseSide(const std::string& side) {
    if (side == "Buy") return OrderSide::BUY;
    if (side == "Sell") return OrderSide::SELL;
    throw InvalidResponse("unknown order side: " + side);
}

[[noreturn]] void throwForRetCode(int code, const std::string& message) {
    switch (code) {
        case 10003:  // invalid api key
        case 10004:  // signature error
        case 10005:  // permission denied
        case 10007:  // user authentication failed
        case 33004:  // api key expired
            throw AuthError(code, message);
        case 10006:  // too many visits
        case 10018:  // ip rate limit
            throw TransientNetworkError("rate limited (retCode " + std::to_string(code) + "): " + message,
                                        true, 0, true);
        case 10016:  // internal server error
            throw TransientNetworkError("server error (retCode " + std::to_string(code) + "): " + message,
                                        true);
        default:
            throw ExchangeRejected(code, message);
    }
}

nlohmann::json unwrapResult(const network::HttpResponse& response) {
    if (response.isUnauthorized()) {
        throw AuthError(response.status_code, snippet(response.body));
    }
    if (response.isRateLimited() || response.isForbidden()) {
        throw TransientNetworkError("HTTP " + std::to_string(response.status_code) + " rate limited",
                                    true, response.status_code, true);
    }
    if (response.isServerError()) {
        throw TransientNetworkError("HTTP " + std::to_string(response.status_code) + ": " + snippet(response.body),
                                    true, response.status_code);
    }
    if (!response.isSuccess()) {
        throw ExchangeRejected(response.status_code, snippet(response.body));
    }

    nlohmann::json body;
    try {
        body = response.json();
    } catch (const nlohmann::json::exception& e) {
        throw InvalidResponse(std::string("malformed JSON response: ") + e.what());
    }

    if (!body.is_object() || !body.contains("retCode")) {
        throw InvalidResponse("response without retCode: " + snippet(response.body));
    }

    const int code = body["retCode"].get<int>();
    if (code != 0) {
        throwForRetCode(code, body.value("retMsg", std::string()));
    }

    auto it = body.find("result");
    if (it == body.end() || it->is_null()) {
        return nlohmann::json::object();
    }
    return *it;
}

WalletBalance parseWalletBalance(const nlohmann::json& result, const std::string& account_type) {
    WalletBalance balance;
    balance.account_type = account_type;

    const auto& accounts = listOf(result);
    if (accounts.empty()) {
        return balance;
    }

    const auto& account = accounts.front();
    auto coins = account.find("coin");
    if (coins == account.end() || !coins->is_array()) {
        return balance;
    }

    for (const auto& item : *coins) {
        CoinBalance coin;
        coin.coin = stringField(item, "coin");
        if (coin.coin.empty()) {
            continue;
        }
        coin.locked = toDouble(item, "locked");
        // SPOT(classic) 계정은 walletBalance 대신 free/locked
        coin.wallet = toDouble(item, "walletBalance", toDouble(item, "free") + coin.locked);
        balance.coins[coin.coin] = coin;
    }
    return balance;
}

TickerSnapshot parseTicker(const nlohmann::json& result, const std::string& symbol) {
    const auto& tickers = listOf(result);
    if (tickers.empty()) {
        throw InvalidResponse("ticker list empty for " + symbol);
    }

    const auto& item = tickers.front();
    TickerSnapshot ticker;
    ticker.symbol = stringField(item, "symbol");
    if (ticker.symbol.empty()) {
        ticker.symbol = symbol;
    }
    ticker.last_price = toDouble(item, "lastPrice");
    if (ticker.last_price <= 0.0) {
        throw InvalidResponse("ticker without lastPrice for " + symbol);
    }

    const double bid = toDouble(item, "bid1Price");
    const double ask = toDouble(item, "ask1Price");
    if (bid > 0.0) ticker.bid = bid;
    if (ask > 0.0) ticker.ask = ask;
    return ticker;
}

SymbolFilters parseSymbolFilters(const nlohmann::json& result, const std::string& symbol,
                                 const std::string& category) {
    const auto& instruments = listOf(result);
    if (instruments.empty()) {
        throw InvalidResponse("instrument not found: " + symbol);
    }

    const auto& info = instruments.front();
    const auto lot = info.value("lotSizeFilter", nlohmann::json::object());
    const auto price = info.value("priceFilter", nlohmann::json::object());

    SymbolFilters filters;
    filters.symbol = symbol;
    filters.min_qty = toDouble(lot, "minOrderQty");
    filters.max_qty = toDouble(lot, "maxOrderQty");

    if (lot.contains("basePrecision")) {
        filters.base_precision = precisionToDecimals(lot["basePrecision"], filters.base_precision);
    }
    if (lot.contains("quotePrecision")) {
        filters.quote_precision = precisionToDecimals(lot["quotePrecision"], filters.quote_precision);
    }

    // spot 은 qtyStep 이 없고 basePrecision 단위가 곧 수량 단위
    filters.qty_step = toDouble(lot, "qtyStep");
    if (filters.qty_step <= 0.0) {
        const double base_step = toDouble(lot, "basePrecision");
        if (lot.contains("basePrecision") && lot["basePrecision"].is_string() && base_step > 0.0) {
            filters.qty_step = base_step;
        } else {
            filters.qty_step = 1.0 / std::pow(10.0, filters.base_precision);
        }
    }

    if (category == "spot") {
        filters.min_notional = toDouble(lot, "minOrderAmt");
    } else {
        filters.min_notional = toDouble(lot, "minNotionalValue");
    }

    filters.price_tick = toDouble(price, "tickSize");
    filters.min_price = toDouble(price, "minPrice");
    filters.max_price = toDouble(price, "maxPrice");

    if (filters.min_qty < 0.0 || filters.price_tick < 0.0) {
        throw InvalidResponse("negative filter values for " + symbol);
    }
    return filters;
}

OrderAck parseOrderAck(const nlohmann::json& result) {
    OrderAck ack;
    ack.order_id = stringField(result, "orderId");
    ack.order_link_id = stringField(result, "orderLinkId");
    if (ack.order_id.empty() && ack.order_link_id.empty()) {
        throw InvalidResponse("order response without orderId");
    }
    return ack;
}

std::vector<ExecutionFill> parseExecutions(const nlohmann::json& result) {
    std::vector<ExecutionFill> fills;
    for (const auto& item : listOf(result)) {
        ExecutionFill fill;
        fill.exec_id = stringField(item, "execId");
        fill.order_id = stringField(item, "orderId");
        fill.order_link_id = stringField(item, "orderLinkId");
        fill.symbol = stringField(item, "symbol");
        fill.side = parseSide(stringField(item, "side"));
        fill.price = toDouble(item, "execPrice");
        fill.quantity = toDouble(item, "execQty");
        fill.fee = toDouble(item, "execFee");
        fill.exec_time_ms = static_cast<long long>(toDouble(item, "execTime"));
        fills.push_back(std::move(fill));
    }
    return fills;
}

std::vector<OpenOrder> parseOpenOrders(const nlohmann::json& result) {
    std::vector<OpenOrder> orders;
    for (const auto& item : listOf(result)) {
        OpenOrder order;
        order.order_id = stringField(item, "orderId");
        order.order_link_id = stringField(item, "orderLinkId");
        order.symbol = stringField(item, "symbol");
        order.side = parseSide(stringField(item, "side"));
        order.order_type = stringField(item, "orderType");
        order.status = stringField(item, "orderStatus");
        order.price = toDouble(item, "price");
        order.quantity = toDouble(item, "qty");
        order.trigger_price = toDouble(item, "triggerPrice");
        orders.push_back(std::move(order));
    }
    return orders;
}

std::vector<Candle> parseCandles(const nlohmann::json& result, long long interval_ms, long long now_ms) {
    std::vector<Candle> candles;
    for (const auto& row : listOf(result)) {
        // [start, open, high, low, close, volume, turnover]
        if (!row.is_array() || row.size() < 6) {
            throw InvalidResponse("malformed kline row: " + row.dump());
        }
        Candle candle;
        candle.period_start_ms = static_cast<long long>(parseNumber(row[0], 0.0));
        candle.open = parseNumber(row[1], 0.0);
        candle.high = parseNumber(row[2], 0.0);
        candle.low = parseNumber(row[3], 0.0);
        candle.close = parseNumber(row[4], 0.0);
        candle.volume = parseNumber(row[5], 0.0);
        candle.confirmed = candle.period_start_ms + interval_ms <= now_ms;
        candles.push_back(candle);
    }

    std::sort(candles.begin(), candles.end(), [](const Candle& a, const Candle& b) {
        return a.period_start_ms < b.period_start_ms;
    });
    return candles;
}

long long intervalToMs(const std::string& interval) {
    constexpr long long kMinute = 60LL * 1000LL;
    if (interval == "D") return 24 * 60 * kMinute;
    if (interval == "W") return 7 * 24 * 60 * kMinute;
    if (interval == "M") return 30 * 24 * 60 * kMinute;

    static const int kMinutes[] = {1, 3, 5, 15, 30, 60, 120, 240, 360, 720};
    for (int minutes : kMinutes) {
        if (interval == std::to_string(minutes)) {
            return minutes * kMinute;
        }
    }
    throw std::invalid_argument("unsupported kline interval: " + interval);
}

} // namespace bybit
} // namespace exchange
} // namespace spotpilot
