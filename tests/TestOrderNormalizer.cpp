#include "execution/OrderNormalizer.h"
#include "common/Errors.h"
#include "common/TickSizeHelper.h"
#include "TestDoubles.h"

#include <cassert>
#include <cmath>
#include <string>
#include <iostream>
#include <memory>

using namespace spotpilot;
using execution::OrderNormalizer;
using spotpilot::testing::FakeExchangeGateway;

namespace {
bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}
}

int main() {
    FakeExchangeGateway reference;
    const SymbolFilters filters = reference.filters;

    // ===== 순수 정규화 =====
    {
        // 0.0001 BTC @ 30000 = 3 USDT < 최소 5 USDT -> 0.0002 (6 USDT)
        const auto buy = OrderNormalizer::normalizeBuyBase(0.0001, 30000.0, filters);
        assert(buy.text == "0.0002");
        assert(near(buy.quantity, 0.0002));
        assert(near(buy.notional, 6.0));

        // 단위 배수로 올림
        assert(OrderNormalizer::normalizeBuyBase(0.00123, 30000.0, filters).text == "0.0013");

        // maxQty 초과는 상한으로 자름
        assert(OrderNormalizer::normalizeBuyBase(150.0, 30000.0, filters).text == "100.0000");

        bool no_price = false;
        try {
            OrderNormalizer::normalizeBuyBase(0.001, 0.0, filters);
        } catch (const PriceUnavailable&) {
            no_price = true;
        }
        assert(no_price);

        // 매도: 내림 + 가용 잔고 상한
        const auto sell = OrderNormalizer::normalizeSellBase(0.00039, 30000.0, 1.0, filters);
        assert(sell.text == "0.0003");
        const auto capped = OrderNormalizer::normalizeSellBase(1.0, 30000.0, 0.00057, filters);
        assert(capped.text == "0.0005");

        bool below_min = false;
        try {
            OrderNormalizer::normalizeSellBase(0.0001, 30000.0, 1.0, filters);   // 3 USDT < 5
        } catch (const InsufficientBalance& e) {
            below_min = true;
            assert(near(e.requested(), 0.0001));
        }
        assert(below_min);

        // 금액: 최소 주문 금액까지 올리고 quote 정밀도로 반올림
        assert(OrderNormalizer::normalizeQuoteAmount(3.0, filters) == "5.00");
        assert(OrderNormalizer::normalizeQuoteAmount(7.456, filters) == "7.46");

        // 가격: tick 반올림, 범위 밖은 거부
        assert(OrderNormalizer::normalizeTriggerPrice(31000.004, filters) == "31000.00");
        bool out_of_range = false;
        try {
            OrderNormalizer::normalizeTriggerPrice(2000000.0, filters);
        } catch (const std::invalid_argument&) {
            out_of_range = true;
        }
        assert(out_of_range);

        SymbolFilters coarse = filters;
        coarse.qty_step = 0.01;
        coarse.base_precision = 6;
        assert(OrderNormalizer::quantityDecimals(coarse) == 6);
    }

    // ===== 단위/가격/요청 수량 조합 전체에서 필터 조건 유지 =====
    {
        const double steps[] = {0.0001, 0.001, 0.01, 1.0};
        const int min_units[] = {1, 3};
        const double prices[] = {0.37, 3.1, 123.45, 30000.0};
        const double requests[] = {0.000001, 0.00037, 0.0123, 0.5, 3.3, 77.0};
        const double availables[] = {0.0, 0.0005, 1.7, 50.0};

        int buys = 0;
        int sells = 0;
        int refused_sells = 0;
        for (double step : steps) {
            for (int units : min_units) {
                SymbolFilters f = filters;
                f.qty_step = step;
                f.min_qty = step * units;
                f.max_qty = 1000000.0;
                f.base_precision = common::decimalsForStep(step);
                const double tolerance = step * 1e-6;

                for (double price : prices) {
                    for (double requested : requests) {
                        // 매수: 단위 배수, minQty 이상, minNotional 이상, 요청보다 적지 않음
                        const auto buy = OrderNormalizer::normalizeBuyBase(requested, price, f);
                        assert(common::isMultipleOfStep(buy.quantity, step));
                        assert(buy.quantity + tolerance >= f.min_qty);
                        assert(buy.quantity * price >= f.min_notional * (1.0 - 1e-9));
                        assert(buy.quantity + tolerance >= requested);
                        assert(std::fabs(std::stod(buy.text) - buy.quantity) < tolerance);
                        ++buys;

                        // 매도: 잔고/요청 이하, 조건을 못 맞추면 InsufficientBalance
                        for (double available : availables) {
                            try {
                                const auto sell = OrderNormalizer::normalizeSellBase(requested, price, available, f);
                                assert(common::isMultipleOfStep(sell.quantity, step));
                                assert(sell.quantity <= available + 1e-12);
                                assert(sell.quantity <= requested + 1e-12);
                                assert(sell.quantity + tolerance >= f.min_qty);
                                assert(sell.quantity * price >= f.min_notional * (1.0 - 1e-9));
                                assert(std::fabs(std::stod(sell.text) - sell.quantity) < tolerance);
                                ++sells;
                            } catch (const InsufficientBalance&) {
                                const double best = common::roundDownToStep(std::min(requested, available), step);
                                assert(best <= 0.0 || best + tolerance < f.min_qty ||
                                       best * price < f.min_notional);
                                ++refused_sells;
                            }
                        }
                    }
                }
            }
        }
        assert(buys == 4 * 2 * 4 * 6);
        assert(sells > 0);
        assert(refused_sells > 0);

        // maxQty 로 잘려 minNotional 을 못 맞추면 거부
        SymbolFilters capped = filters;
        capped.max_qty = 0.001;
        bool refused = false;
        try {
            OrderNormalizer::normalizeBuyBase(0.001, 1000.0, capped);   // 최대 1 USDT < 5
        } catch (const std::invalid_argument&) {
            refused = true;
        }
        assert(refused);
    }

    // ===== 매도 수량이 단위 미만이면 주문을 보내지 않음 =====
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->balances["BTC"] = 0.00005;
        OrderNormalizer normalizer(gateway, "BTCUSDT", "USDT");
        assert(normalizer.baseCoin() == "BTC");

        bool thrown = false;
        try {
            normalizer.sellByBase(0.00005);
        } catch (const InsufficientBalance&) {
            thrown = true;
        }
        assert(thrown);
        assert(gateway->placed.empty());

        gateway->balances["BTC"] = 0.0;
        thrown = false;
        try {
            normalizer.sellByBase(0.001);
        } catch (const InsufficientBalance& e) {
            thrown = true;
            assert(near(e.available(), 0.0));
        }
        assert(thrown);
        assert(gateway->placed.empty());
    }

    // ===== 매도: 잔고는 매번 새로 조회 =====
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->balances["BTC"] = 0.00057;
        OrderNormalizer normalizer(gateway, "BTCUSDT");

        const auto result = normalizer.sellByBase(0.001);
        assert(gateway->placed.size() == 1);
        const auto& request = gateway->placed.front();
        assert(request.side == OrderSide::SELL);
        assert(request.type == OrderType::MARKET);
        assert(request.quantity == "0.0005");
        assert(!request.market_unit);
        assert(result.submitted_quantity == "0.0005");
        assert(gateway->balance_calls == 1);

        normalizer.sellByBase(0.0002);
        assert(gateway->balance_calls == 2);
        assert(gateway->filter_calls == 1);
    }

    // ===== 금액 기준 매수: DEMO 는 marketUnit 생략 =====
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        OrderNormalizer normalizer(gateway, "BTCUSDT");

        const auto result = normalizer.buyByQuote(3.0);
        const auto& request = gateway->placed.back();
        assert(request.quantity == "5.00");
        assert(request.market_unit && *request.market_unit == MarketUnit::QUOTE_COIN);
        assert(request.time_in_force == TimeInForce::IOC);
        assert(request.order_link_id.rfind("sp", 0) == 0);
        assert(result.order_link_id == request.order_link_id);
        assert(!result.order_id.empty());

        gateway->env = ExchangeEnvironment::DEMO;
        normalizer.buyByQuote(10.0);
        assert(!gateway->placed.back().market_unit);
        assert(gateway->placed.back().quantity == "10.00");
    }

    // ===== 수량 기준 매수: 가격이 없으면 전송하지 않음 =====
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->ticker_error = std::make_exception_ptr(InvalidResponse("ticker without lastPrice"));
        OrderNormalizer normalizer(gateway, "BTCUSDT");

        bool thrown = false;
        try {
            normalizer.buyByBase(0.0001);
        } catch (const PriceUnavailable&) {
            thrown = true;
        }
        assert(thrown);
        assert(gateway->placed.empty());

        gateway->ticker_error = nullptr;
        normalizer.buyByBase(0.0001);
        assert(gateway->placed.size() == 1);
        assert(gateway->placed.front().quantity == "0.0002");
        assert(*gateway->placed.front().market_unit == MarketUnit::BASE_COIN);
    }

    // ===== 거래소 거절은 그대로 전파 =====
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        gateway->on_place = [](const OrderRequest&) -> OrderAck {
            throw ExchangeRejected(170131, "Insufficient balance.");
        };
        OrderNormalizer normalizer(gateway, "BTCUSDT");
        bool thrown = false;
        try {
            normalizer.buyByQuote(5.0);
        } catch (const ExchangeRejected& e) {
            thrown = true;
            assert(e.code() == 170131);
        }
        assert(thrown);
    }

    // ===== 조건부 / 지정가 / 취소 =====
    {
        auto gateway = std::make_shared<FakeExchangeGateway>();
        OrderNormalizer normalizer(gateway, "BTCUSDT");

        normalizer.placeConditional(OrderSide::SELL, 0.00129, 31000.004, OrderType::MARKET);
        auto request = gateway->placed.back();
        assert(request.tpsl_order);
        assert(request.trigger_price && *request.trigger_price == "31000.00");
        assert(!request.price);
        assert(request.quantity == "0.0012");
        assert(request.time_in_force == TimeInForce::IOC);

        normalizer.placeConditional(OrderSide::SELL, 0.001, 29000.0, OrderType::LIMIT);
        request = gateway->placed.back();
        assert(request.price && *request.price == "29000.00");
        assert(request.time_in_force == TimeInForce::GTC);

        normalizer.placeLimit(OrderSide::BUY, 0.001, 28000.123, TimeInForce::POST_ONLY);
        request = gateway->placed.back();
        assert(request.type == OrderType::LIMIT);
        assert(*request.price == "28000.12");
        assert(request.time_in_force == TimeInForce::POST_ONLY);
        assert(!request.tpsl_order);

        const auto ack = normalizer.cancel(std::string("order-1"), std::nullopt);
        assert(ack.order_id == "order-1");
        assert(gateway->cancelled.size() == 1);
        assert(gateway->cancelled.front().symbol == "BTCUSDT");
    }

    // ===== 심볼 / quote 불일치 =====
    {
        bool thrown = false;
        try {
            OrderNormalizer normalizer(std::make_shared<FakeExchangeGateway>(), "BTCUSDC", "USDT");
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    std::cout << "[TEST] OrderNormalizer PASSED\n";
    return 0;
}
