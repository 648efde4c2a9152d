#include "exchange/BybitGateway.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "exchange/BybitResponseParser.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <sstream>

namespace spotpilot {
namespace exchange {
namespace {
long long systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

std::string joinCoins(const std::vector<std::string>& coins) {
    std::ostringstream oss;
    for (size_t i = 0; i < coins.size(); ++i) {
        if (i > 0) oss << ",";
        oss << coins[i];
    }
    return oss.str();
}
}

BybitGateway::BybitGateway(
    std::shared_ptr<network::IHttpClient> http_client,
    GatewayConfig config,
    execution::RetryExecutor executor,
    Clock clock
)
    : http_client_(std::move(http_client))
    , config_(std::move(config))
    , executor_(std::move(executor))
    , clock_(clock ? std::move(clock) : Clock(systemNowMs))
{
    if (!http_client_) {
        throw std::invalid_argument("BybitGateway requires an HTTP client");
    }
}

std::string BybitGateway::resolvedAccountType() const {
    std::lock_guard<std::mutex> lock(account_mutex_);
    return resolved_account_type_;
}

std::vector<std::string> BybitGateway::accountTypeOrder() const {
    std::vector<std::string> order;
    auto push_unique = [&order](const std::string& type) {
        if (!type.empty() && std::find(order.begin(), order.end(), type) == order.end()) {
            order.push_back(type);
        }
    };

    {
        std::lock_guard<std::mutex> lock(account_mutex_);
        push_unique(resolved_account_type_);
    }
    push_unique(config_.account_type);
    for (const auto& type : config_.account_type_candidates) {
        push_unique(type);
    }
    return order;
}

WalletBalance BybitGateway::fetchWalletBalance(const std::string& account_type,
                                               const std::vector<std::string>& coins) {
    return executor_.run(config_.read_policy, "getWalletBalance[" + account_type + "]", [&]() {
        std::map<std::string, std::string> params{{"accountType", account_type}};
        if (!coins.empty()) {
            params["coin"] = joinCoins(coins);
        }
        const auto result = bybit::unwrapResult(
            http_client_->get("/v5/account/wallet-balance", params, true));
        return bybit::parseWalletBalance(result, account_type);
    });
}

WalletBalance BybitGateway::getWalletBalance(const std::vector<std::string>& coins) {
    std::exception_ptr last_error;

    for (const auto& account_type : accountTypeOrder()) {
        try {
            auto balance = fetchWalletBalance(account_type, coins);
            {
                std::lock_guard<std::mutex> lock(account_mutex_);
                if (resolved_account_type_ != account_type) {
                    LOG_INFO("Wallet balance resolved with accountType={}", account_type);
                }
                resolved_account_type_ = account_type;
            }
            return balance;
        } catch (const AuthError& e) {
            LOG_WARN("accountType={} not authorized: {}", account_type, e.what());
            last_error = std::current_exception();
        } catch (const ExchangeRejected& e) {
            LOG_WARN("accountType={} rejected: {}", account_type, e.what());
            last_error = std::current_exception();
        }
    }

    if (last_error) {
        std::rethrow_exception(last_error);
    }
    throw InvalidResponse("no account type candidates configured");
}

TickerSnapshot BybitGateway::getTicker(const std::string& symbol) {
    return executor_.run(config_.read_policy, "getTicker", [&]() {
        const auto result = bybit::unwrapResult(http_client_->get(
            "/v5/market/tickers", {{"category", config_.category}, {"symbol", symbol}}));
        return bybit::parseTicker(result, symbol);
    });
}

SymbolFilters BybitGateway::getSymbolFilters(const std::string& symbol) {
    return executor_.run(config_.read_policy, "getSymbolFilters", [&]() {
        const auto result = bybit::unwrapResult(http_client_->get(
            "/v5/market/instruments-info", {{"category", config_.category}, {"symbol", symbol}}));
        return bybit::parseSymbolFilters(result, symbol, config_.category);
    });
}

nlohmann::json BybitGateway::buildOrderBody(const OrderRequest& request,
                                            const std::string& category) {
    nlohmann::json body;
    body["category"] = category;
    body["symbol"] = request.symbol;
    body["side"] = toString(request.side);
    body["orderType"] = toString(request.type);
    body["qty"] = request.quantity;
    body["timeInForce"] = toString(request.time_in_force);

    if (request.market_unit) {
        body["marketUnit"] = *request.market_unit == MarketUnit::QUOTE_COIN ? "quoteCoin" : "baseCoin";
    }
    if (request.price) {
        body["price"] = *request.price;
    }
    if (request.trigger_price) {
        body["triggerPrice"] = *request.trigger_price;
    }
    if (request.tpsl_order) {
        body["orderFilter"] = "tpslOrder";
    }
    if (!request.order_link_id.empty()) {
        body["orderLinkId"] = request.order_link_id;
    }
    return body;
}

OrderAck BybitGateway::placeOrder(const OrderRequest& request) {
    const auto body = buildOrderBody(request, config_.category);
    LOG_INFO("Submitting order: {} {} {} qty={} link={}",
             request.symbol, toString(request.side), toString(request.type),
             request.quantity, request.order_link_id);

    try {
        return executor_.run(config_.write_policy, "placeOrder", [&]() {
            const auto result = bybit::unwrapResult(http_client_->post("/v5/order/create", body));
            return bybit::parseOrderAck(result);
        });
    } catch (const ExchangeRejected& e) {
        LOG_ERROR("Order rejected: {} {} qty={} price={} trigger={} code={} msg={}",
                  request.symbol, toString(request.side), request.quantity,
                  request.price.value_or("-"), request.trigger_price.value_or("-"),
                  e.code(), e.exchangeMessage());
        throw;
    }
}

OrderAck BybitGateway::cancelOrder(const CancelRequest& request) {
    if (!request.order_id && !request.order_link_id) {
        throw std::invalid_argument("cancelOrder requires order_id or order_link_id");
    }

    nlohmann::json body;
    body["category"] = config_.category;
    body["symbol"] = request.symbol;
    if (request.order_id) {
        body["orderId"] = *request.order_id;
    }
    if (request.order_link_id) {
        body["orderLinkId"] = *request.order_link_id;
    }

    return executor_.run(config_.write_policy, "cancelOrder", [&]() {
        const auto result = bybit::unwrapResult(http_client_->post("/v5/order/cancel", body));
        return bybit::parseOrderAck(result);
    });
}

std::vector<ExecutionFill> BybitGateway::getExecutions(
    const std::string& symbol,
    const std::string& order_id,
    int limit
) {
    return executor_.run(config_.read_policy, "getExecutions", [&]() {
        std::map<std::string, std::string> params{
            {"category", config_.category},
            {"symbol", symbol},
            {"limit", std::to_string(limit)}
        };
        if (!order_id.empty()) {
            params["orderId"] = order_id;
        }
        const auto result = bybit::unwrapResult(
            http_client_->get("/v5/execution/list", params, true));
        return bybit::parseExecutions(result);
    });
}

std::vector<Candle> BybitGateway::getCandles(
    const std::string& symbol,
    const std::string& interval,
    int limit
) {
    const long long interval_ms = bybit::intervalToMs(interval);
    return executor_.run(config_.read_policy, "getCandles", [&]() {
        const auto result = bybit::unwrapResult(http_client_->get("/v5/market/kline", {
            {"category", config_.category},
            {"symbol", symbol},
            {"interval", interval},
            {"limit", std::to_string(limit)}
        }));
        return bybit::parseCandles(result, interval_ms, clock_());
    });
}

std::vector<OpenOrder> BybitGateway::getOpenOrders(const std::string& symbol) {
    return executor_.run(config_.read_policy, "getOpenOrders", [&]() {
        const auto result = bybit::unwrapResult(http_client_->get(
            "/v5/order/realtime", {{"category", config_.category}, {"symbol", symbol}}, true));
        return bybit::parseOpenOrders(result);
    });
}

} // namespace exchange
} // namespace spotpilot
