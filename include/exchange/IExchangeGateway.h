#pragma once

#include "common/Types.h"

#include <string>
#include <vector>

namespace spotpilot {
namespace exchange {

// 거래소 기능 1개당 연산 1개. 일시적 장애는 내부에서 재시도하고
// 나머지 오류(TradingError 계열)는 호출자에게 그대로 전파한다.
class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    // coins 가 비어 있으면 전체 자산
    virtual WalletBalance getWalletBalance(const std::vector<std::string>& coins = {}) = 0;

    virtual TickerSnapshot getTicker(const std::string& symbol) = 0;

    virtual SymbolFilters getSymbolFilters(const std::string& symbol) = 0;

    // 유일한 변경 연산 - 결과가 모호한 실패는 재시도하지 않음
    virtual OrderAck placeOrder(const OrderRequest& request) = 0;

    virtual OrderAck cancelOrder(const CancelRequest& request) = 0;

    // order_id 가 비어 있으면 최근 체결 전체
    virtual std::vector<ExecutionFill> getExecutions(
        const std::string& symbol,
        const std::string& order_id = "",
        int limit = 50
    ) = 0;

    // 오래된 봉부터 정렬된 결과
    virtual std::vector<Candle> getCandles(
        const std::string& symbol,
        const std::string& interval,
        int limit
    ) = 0;

    virtual std::vector<OpenOrder> getOpenOrders(const std::string& symbol) = 0;

    virtual ExchangeEnvironment environment() const = 0;
};

} // namespace exchange
} // namespace spotpilot
