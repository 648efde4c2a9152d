#include "execution/OrderNormalizer.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "common/TickSizeHelper.h"
#include "network/RequestSigner.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace spotpilot {
namespace execution {
namespace {
// 최대 수량 초과분은 단위 배수로 내려 자른다
double clampToMax(double quantity, const SymbolFilters& filters) {
    if (filters.max_qty > 0.0 && quantity > filters.max_qty + common::STEP_EPSILON) {
        const double clamped = common::roundDownToStep(filters.max_qty, filters.qty_step);
        LOG_WARN("{} quantity {} above maxQty {}, clamped to {}",
                 filters.symbol, quantity, filters.max_qty, clamped);
        return clamped;
    }
    return quantity;
}

double quoteStep(const SymbolFilters& filters) {
    return 1.0 / std::pow(10.0, filters.quote_precision);
}
}

OrderNormalizer::OrderNormalizer(
    std::shared_ptr<exchange::IExchangeGateway> gateway,
    std::string symbol,
    std::string quote_coin
)
    : gateway_(std::move(gateway))
    , symbol_(std::move(symbol))
    , quote_coin_(std::move(quote_coin))
{
    if (!gateway_) {
        throw std::invalid_argument("OrderNormalizer requires an exchange gateway");
    }
    const bool has_suffix = symbol_.size() > quote_coin_.size() &&
        symbol_.compare(symbol_.size() - quote_coin_.size(), quote_coin_.size(), quote_coin_) == 0;
    if (!has_suffix) {
        throw std::invalid_argument("symbol " + symbol_ + " is not quoted in " + quote_coin_);
    }
    base_coin_ = symbol_.substr(0, symbol_.size() - quote_coin_.size());
}

int OrderNormalizer::quantityDecimals(const SymbolFilters& filters) {
    if (filters.qty_step > 0.0) {
        return std::max(filters.base_precision, common::decimalsForStep(filters.qty_step));
    }
    return filters.base_precision;
}

std::string OrderNormalizer::normalizeQuoteAmount(double requested_quote, const SymbolFilters& filters) {
    if (!(requested_quote > 0.0)) {
        throw std::invalid_argument("quote amount must be positive");
    }

    const double amount = std::max(requested_quote, filters.min_notional);
    double rounded = common::roundToDecimals(amount, filters.quote_precision);
    if (rounded + common::STEP_EPSILON < filters.min_notional) {
        rounded = common::roundUpToStep(amount, quoteStep(filters));
    }
    return common::formatFixed(rounded, filters.quote_precision);
}

NormalizedQuantity OrderNormalizer::normalizeBuyBase(double requested_base, double price,
                                                     const SymbolFilters& filters) {
    if (!(price > 0.0)) {
        throw PriceUnavailable("no price for " + filters.symbol + ", cannot size buy");
    }
    if (!(requested_base > 0.0)) {
        throw std::invalid_argument("base quantity must be positive");
    }

    const double step = filters.qty_step;
    double quantity = common::roundUpToStep(requested_base, step);
    if (quantity < filters.min_qty) {
        quantity = common::roundUpToStep(filters.min_qty, step);
    }

    if (filters.min_notional > 0.0 && quantity * price < filters.min_notional) {
        quantity = common::roundUpToStep(filters.min_notional / price, step);
        if (quantity < filters.min_qty) {
            quantity = common::roundUpToStep(filters.min_qty, step);
        }
    }

    const double unclamped = quantity;
    quantity = clampToMax(quantity, filters);
    if (quantity < unclamped && filters.min_notional > 0.0 && quantity * price < filters.min_notional) {
        throw std::invalid_argument("buy of " + filters.symbol + " cannot reach minimum notional within maxQty");
    }

    NormalizedQuantity result;
    result.quantity = quantity;
    result.text = common::formatFixed(quantity, quantityDecimals(filters));
    result.notional = quantity * price;
    return result;
}

NormalizedQuantity OrderNormalizer::normalizeSellBase(double requested_base, double price,
                                                      double available_base, const SymbolFilters& filters) {
    const double step = filters.qty_step;
    double quantity = std::min(requested_base, available_base);
    quantity = common::roundDownToStep(std::max(quantity, 0.0), step);
    if (quantity > available_base) {
        quantity = common::roundDownToStep(available_base, step);
    }
    quantity = clampToMax(quantity, filters);

    if (quantity <= 0.0) {
        throw InsufficientBalance(
            "sell quantity for " + filters.symbol + " is zero after normalization",
            requested_base, available_base);
    }
    if (quantity + common::STEP_EPSILON < filters.min_qty) {
        throw InsufficientBalance(
            "sell quantity " + common::formatFixed(quantity, quantityDecimals(filters)) +
            " below minQty " + common::formatFixed(filters.min_qty, quantityDecimals(filters)),
            requested_base, available_base);
    }
    if (price > 0.0 && filters.min_notional > 0.0 && quantity * price < filters.min_notional) {
        throw InsufficientBalance(
            "sell notional " + common::formatFixed(quantity * price, 4) +
            " below minimum " + common::formatFixed(filters.min_notional, filters.quote_precision),
            requested_base, available_base);
    }

    NormalizedQuantity result;
    result.quantity = quantity;
    result.text = common::formatFixed(quantity, quantityDecimals(filters));
    result.notional = price > 0.0 ? quantity * price : 0.0;
    return result;
}

std::string OrderNormalizer::normalizeTriggerPrice(double price, const SymbolFilters& filters) {
    if (!(price > 0.0)) {
        throw std::invalid_argument("price must be positive");
    }
    const double rounded = common::roundToStep(price, filters.price_tick);
    if (filters.min_price > 0.0 && rounded < filters.min_price) {
        throw std::invalid_argument("price below minPrice for " + filters.symbol);
    }
    if (filters.max_price > 0.0 && rounded > filters.max_price) {
        throw std::invalid_argument("price above maxPrice for " + filters.symbol);
    }
    const int decimals = filters.price_tick > 0.0 ? common::decimalsForStep(filters.price_tick)
                                                   : filters.quote_precision;
    return common::formatFixed(rounded, decimals);
}

SymbolFilters OrderNormalizer::filters() {
    std::lock_guard<std::mutex> lock(filters_mutex_);
    if (!filters_) {
        filters_ = gateway_->getSymbolFilters(symbol_);
        LOG_INFO("{} filters: qtyStep={} minQty={} maxQty={} basePrecision={} quotePrecision={} "
                 "tick={} minNotional={}",
                 symbol_, filters_->qty_step, filters_->min_qty, filters_->max_qty,
                 filters_->base_precision, filters_->quote_precision,
                 filters_->price_tick, filters_->min_notional);
    }
    return *filters_;
}

void OrderNormalizer::refreshFilters() {
    {
        std::lock_guard<std::mutex> lock(filters_mutex_);
        filters_.reset();
    }
    filters();
}

double OrderNormalizer::currentPrice() {
    const auto ticker = gateway_->getTicker(symbol_);
    return ticker.last_price;
}

OrderResult OrderNormalizer::submit(OrderRequest request, const char* label) {
    if (request.order_link_id.empty()) {
        request.order_link_id = network::RequestSigner::generateOrderLinkId();
    }

    const auto ack = gateway_->placeOrder(request);

    OrderResult result;
    result.order_id = ack.order_id;
    result.order_link_id = ack.order_link_id.empty() ? request.order_link_id : ack.order_link_id;
    result.side = request.side;
    result.submitted_quantity = request.quantity;

    LOG_INFO("{} accepted: {} orderId={} link={} qty={}",
             label, symbol_, result.order_id, result.order_link_id, request.quantity);
    return result;
}

OrderResult OrderNormalizer::buyByQuote(double quote_amount) {
    const auto symbol_filters = filters();
    const std::string quote_text = normalizeQuoteAmount(quote_amount, symbol_filters);

    LOG_INFO("Market BUY by quote: {} {} (requested {}, minNotional {}, quotePrecision {})",
             quote_text, quote_coin_, quote_amount, symbol_filters.min_notional,
             symbol_filters.quote_precision);

    OrderRequest request;
    request.symbol = symbol_;
    request.side = OrderSide::BUY;
    request.type = OrderType::MARKET;
    request.quantity = quote_text;
    request.time_in_force = TimeInForce::IOC;
    // DEMO 는 marketUnit 미지원 (spot 시장가 매수 기본 단위가 quote)
    if (gateway_->environment() != ExchangeEnvironment::DEMO) {
        request.market_unit = MarketUnit::QUOTE_COIN;
    }
    return submit(std::move(request), "Market BUY (quote)");
}

OrderResult OrderNormalizer::buyByBase(double base_quantity) {
    const auto symbol_filters = filters();

    double price = 0.0;
    try {
        price = currentPrice();
    } catch (const InvalidResponse& e) {
        throw PriceUnavailable("ticker unavailable for " + symbol_ + ": " + e.what());
    }

    const auto normalized = normalizeBuyBase(base_quantity, price, symbol_filters);
    LOG_INFO("Normalized buy qty: {} | requested={} price~{} notional~{} minNotional={} minQty={} step={}",
             normalized.text, base_quantity, price, normalized.notional,
             symbol_filters.min_notional, symbol_filters.min_qty, symbol_filters.qty_step);

    OrderRequest request;
    request.symbol = symbol_;
    request.side = OrderSide::BUY;
    request.type = OrderType::MARKET;
    request.quantity = normalized.text;
    request.time_in_force = TimeInForce::IOC;
    if (gateway_->environment() != ExchangeEnvironment::DEMO) {
        request.market_unit = MarketUnit::BASE_COIN;
    }
    return submit(std::move(request), "Market BUY (base)");
}

OrderResult OrderNormalizer::sellByBase(double base_quantity) {
    const auto symbol_filters = filters();
    const auto balance = gateway_->getWalletBalance({base_coin_});
    const double available = balance.available(base_coin_);

    if (available <= 0.0) {
        throw InsufficientBalance("no " + base_coin_ + " available to sell", base_quantity, available);
    }

    const double price = currentPrice();
    const auto normalized = normalizeSellBase(base_quantity, price, available, symbol_filters);
    LOG_INFO("Normalized sell qty: {} | requested={} available={} price~{} minNotional={} minQty={} step={}",
             normalized.text, base_quantity, available, price,
             symbol_filters.min_notional, symbol_filters.min_qty, symbol_filters.qty_step);

    OrderRequest request;
    request.symbol = symbol_;
    request.side = OrderSide::SELL;
    request.type = OrderType::MARKET;
    request.quantity = normalized.text;
    request.time_in_force = TimeInForce::IOC;
    return submit(std::move(request), "Market SELL");
}

OrderResult OrderNormalizer::placeConditional(OrderSide side, double quantity, double trigger_price,
                                              OrderType type) {
    const auto symbol_filters = filters();
    const std::string trigger_text = normalizeTriggerPrice(trigger_price, symbol_filters);

    double rounded = side == OrderSide::BUY
        ? common::roundUpToStep(quantity, symbol_filters.qty_step)
        : common::roundDownToStep(quantity, symbol_filters.qty_step);
    rounded = clampToMax(rounded, symbol_filters);
    if (rounded <= 0.0 || rounded + common::STEP_EPSILON < symbol_filters.min_qty) {
        throw std::invalid_argument("conditional order quantity below minQty for " + symbol_);
    }

    OrderRequest request;
    request.symbol = symbol_;
    request.side = side;
    request.type = type;
    request.quantity = common::formatFixed(rounded, quantityDecimals(symbol_filters));
    request.trigger_price = trigger_text;
    request.tpsl_order = true;
    if (type == OrderType::LIMIT) {
        request.price = trigger_text;
        request.time_in_force = TimeInForce::GTC;
    } else {
        request.time_in_force = TimeInForce::IOC;
    }

    LOG_INFO("TP/SL {} {} qty={} trigger={} (requested {})",
             toString(side), toString(type), request.quantity, trigger_text, trigger_price);
    return submit(std::move(request), "Conditional order");
}

OrderResult OrderNormalizer::placeLimit(OrderSide side, double quantity, double price, TimeInForce tif) {
    const auto symbol_filters = filters();
    const std::string price_text = normalizeTriggerPrice(price, symbol_filters);

    double rounded = side == OrderSide::BUY
        ? common::roundUpToStep(std::max(quantity, symbol_filters.min_qty), symbol_filters.qty_step)
        : common::roundDownToStep(quantity, symbol_filters.qty_step);
    rounded = clampToMax(rounded, symbol_filters);
    if (rounded <= 0.0 || rounded + common::STEP_EPSILON < symbol_filters.min_qty) {
        throw std::invalid_argument("limit order quantity below minQty for " + symbol_);
    }

    OrderRequest request;
    request.symbol = symbol_;
    request.side = side;
    request.type = OrderType::LIMIT;
    request.quantity = common::formatFixed(rounded, quantityDecimals(symbol_filters));
    request.price = price_text;
    request.time_in_force = tif;
    return submit(std::move(request), "Limit order");
}

OrderAck OrderNormalizer::cancel(const std::optional<std::string>& order_id,
                                 const std::optional<std::string>& order_link_id) {
    CancelRequest request;
    request.symbol = symbol_;
    request.order_id = order_id;
    request.order_link_id = order_link_id;
    const auto ack = gateway_->cancelOrder(request);
    LOG_INFO("Cancelled {} orderId={} link={}", symbol_, ack.order_id, ack.order_link_id);
    return ack;
}

std::vector<OpenOrder> OrderNormalizer::openOrders() {
    return gateway_->getOpenOrders(symbol_);
}

} // namespace execution
} // namespace spotpilot
