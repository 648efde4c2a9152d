#pragma once

#include "common/Types.h"
#include "exchange/IExchangeGateway.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace spotpilot {
namespace execution {

struct NormalizedQuantity {
    double quantity = 0.0;
    std::string text;          // 전송용 고정소수점 문자열
    double notional = 0.0;     // quantity * 기준 가격 (가격 없으면 0)
};

// 주문 수량/가격을 거래소 필터에 맞춘 뒤 게이트웨이로 제출
//  - 매수: 수량 단위로 올림, minQty / minNotional 까지 끌어올림
//  - 매도: 내림 + 가용 잔고 상한. 최소 조건을 못 맞추면 InsufficientBalance (전송 안 함)
class OrderNormalizer {
public:
    OrderNormalizer(
        std::shared_ptr<exchange::IExchangeGateway> gateway,
        std::string symbol,
        std::string quote_coin = "USDT"
    );

    // ===== 순수 함수 =====
    static std::string normalizeQuoteAmount(double requested_quote, const SymbolFilters& filters);
    // maxQty 안에서 minNotional 을 맞출 수 없으면 std::invalid_argument
    static NormalizedQuantity normalizeBuyBase(double requested_base, double price,
                                               const SymbolFilters& filters);
    static NormalizedQuantity normalizeSellBase(double requested_base, double price,
                                                double available_base, const SymbolFilters& filters);
    // 호가 단위 반올림, [minPrice, maxPrice] 밖이면 std::invalid_argument
    static std::string normalizeTriggerPrice(double price, const SymbolFilters& filters);
    static int quantityDecimals(const SymbolFilters& filters);

    // ===== 거래소 호출 =====
    // 잔고 사전 확인 없음 - 자금 부족은 거래소의 ExchangeRejected 로 드러남
    OrderResult buyByQuote(double quote_amount);
    // 현재가가 없으면 PriceUnavailable (전송 안 함)
    OrderResult buyByBase(double base_quantity);
    // 매 호출마다 잔고를 새로 조회
    OrderResult sellByBase(double base_quantity);

    // spot TP/SL 조건부 주문 (orderFilter=tpslOrder)
    OrderResult placeConditional(OrderSide side, double quantity, double trigger_price,
                                 OrderType type = OrderType::MARKET);
    OrderResult placeLimit(OrderSide side, double quantity, double price,
                           TimeInForce tif = TimeInForce::GTC);

    OrderAck cancel(const std::optional<std::string>& order_id,
                    const std::optional<std::string>& order_link_id = std::nullopt);
    std::vector<OpenOrder> openOrders();

    // 첫 호출 시 조회 후 프로세스 수명 동안 캐시
    SymbolFilters filters();
    void refreshFilters();

    const std::string& symbol() const { return symbol_; }
    const std::string& baseCoin() const { return base_coin_; }
    const std::string& quoteCoin() const { return quote_coin_; }

private:
    OrderResult submit(OrderRequest request, const char* label);
    double currentPrice();

    std::shared_ptr<exchange::IExchangeGateway> gateway_;
    std::string symbol_;
    std::string quote_coin_;
    std::string base_coin_;

    std::mutex filters_mutex_;
    std::optional<SymbolFilters> filters_;
};

} // namespace execution
} // namespace spotpilot
