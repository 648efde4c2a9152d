#pragma once

#include "exchange/GatewayConfig.h"
#include "exchange/IExchangeGateway.h"
#include "execution/RetryPolicy.h"
#include "network/IHttpClient.h"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spotpilot {
namespace exchange {

class BybitGateway : public IExchangeGateway {
public:
    using Clock = std::function<long long()>;

    BybitGateway(
        std::shared_ptr<network::IHttpClient> http_client,
        GatewayConfig config,
        execution::RetryExecutor executor = execution::RetryExecutor(),
        Clock clock = nullptr
    );

    WalletBalance getWalletBalance(const std::vector<std::string>& coins = {}) override;
    TickerSnapshot getTicker(const std::string& symbol) override;
    SymbolFilters getSymbolFilters(const std::string& symbol) override;
    OrderAck placeOrder(const OrderRequest& request) override;
    OrderAck cancelOrder(const CancelRequest& request) override;
    std::vector<ExecutionFill> getExecutions(
        const std::string& symbol,
        const std::string& order_id = "",
        int limit = 50
    ) override;
    std::vector<Candle> getCandles(
        const std::string& symbol,
        const std::string& interval,
        int limit
    ) override;
    std::vector<OpenOrder> getOpenOrders(const std::string& symbol) override;

    ExchangeEnvironment environment() const override { return config_.environment; }

    // 마지막으로 잔고 조회에 성공한 계정 유형 (없으면 빈 문자열)
    std::string resolvedAccountType() const;

    static nlohmann::json buildOrderBody(const OrderRequest& request,
                                         const std::string& category);

private:
    std::vector<std::string> accountTypeOrder() const;
    WalletBalance fetchWalletBalance(const std::string& account_type,
                                     const std::vector<std::string>& coins);

    std::shared_ptr<network::IHttpClient> http_client_;
    GatewayConfig config_;
    execution::RetryExecutor executor_;
    Clock clock_;

    mutable std::mutex account_mutex_;
    std::string resolved_account_type_;
};

} // namespace exchange
} // namespace spotpilot
