#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>

namespace spotpilot {

using Timestamp = std::chrono::system_clock::time_point;
using Price = double;
using Volume = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderType { MARKET, LIMIT };
enum class TimeInForce { GTC, IOC, FOK, POST_ONLY };
// 시장가 주문 수량 단위 (DEMO 계정은 지원하지 않음)
enum class MarketUnit { BASE_COIN, QUOTE_COIN };

enum class ExchangeEnvironment { DEMO, TESTNET, PRODUCTION };

// 종목별 주문 필터 - 호출자가 프로세스 수명 동안 캐시
struct SymbolFilters {
    std::string symbol;
    double qty_step = 0.0;
    double min_qty = 0.0;
    double max_qty = 0.0;
    int base_precision = 6;     // 수량 소수 자릿수
    int quote_precision = 2;    // 금액 소수 자릿수
    double price_tick = 0.0;
    double min_price = 0.0;
    double max_price = 0.0;
    double min_notional = 0.0;
};

struct Tick {
    std::string symbol;
    Price price = 0.0;
    long long observed_at_ms = 0;
};

struct Candle {
    long long period_start_ms = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    bool confirmed = false;

    Candle() = default;

    Candle(long long start, double o, double h, double l, double c, double v, bool done)
        : period_start_ms(start), open(o), high(h), low(l), close(c), volume(v), confirmed(done) {}
};

struct TickerSnapshot {
    std::string symbol;
    Price last_price = 0.0;
    std::optional<Price> bid;
    std::optional<Price> ask;
};

struct CoinBalance {
    std::string coin;
    Amount wallet = 0.0;
    Amount locked = 0.0;

    Amount available() const { return wallet > locked ? wallet - locked : 0.0; }
};

// 자산별 잔고 스냅샷 (매 조회마다 새로 받음, 캐시하지 않음)
struct WalletBalance {
    std::string account_type;
    std::map<std::string, CoinBalance> coins;

    Amount available(const std::string& coin) const {
        auto it = coins.find(coin);
        return it == coins.end() ? 0.0 : it->second.available();
    }
};

struct OrderRequest {
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    OrderType type = OrderType::MARKET;
    std::string quantity;                    // 이미 정규화된 고정소수점 문자열
    std::optional<MarketUnit> market_unit;
    std::optional<std::string> price;
    std::optional<std::string> trigger_price;
    TimeInForce time_in_force = TimeInForce::IOC;
    bool tpsl_order = false;
    std::string order_link_id;
};

struct CancelRequest {
    std::string symbol;
    std::optional<std::string> order_id;
    std::optional<std::string> order_link_id;
};

struct OrderAck {
    std::string order_id;
    std::string order_link_id;
};

// 정규화 + 제출 결과. 체결 정보는 체결 내역 조회 후 채워짐
struct OrderResult {
    std::string order_id;
    std::string order_link_id;
    OrderSide side = OrderSide::BUY;
    std::string submitted_quantity;
    Volume filled_quantity = 0.0;
    Price average_price = 0.0;
};

struct ExecutionFill {
    std::string exec_id;
    std::string order_id;
    std::string order_link_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    Price price = 0.0;
    Volume quantity = 0.0;
    Amount fee = 0.0;
    long long exec_time_ms = 0;
};

struct OpenOrder {
    std::string order_id;
    std::string order_link_id;
    std::string symbol;
    OrderSide side = OrderSide::BUY;
    std::string order_type;
    std::string status;
    Price price = 0.0;
    Volume quantity = 0.0;
    Price trigger_price = 0.0;
};

inline const char* toString(OrderSide side) {
    return side == OrderSide::BUY ? "Buy" : "Sell";
}

inline const char* toString(OrderType type) {
    return type == OrderType::MARKET ? "Market" : "Limit";
}

inline const char* toString(TimeInForce tif) {
    switch (tif) {
        case TimeInForce::GTC: return "GTC";
        case TimeInForce::IOC: return "IOC";
        case TimeInForce::FOK: return "FOK";
        case TimeInForce::POST_ONLY: return "PostOnly";
    }
    return "GTC";
}

inline const char* toString(ExchangeEnvironment env) {
    switch (env) {
        case ExchangeEnvironment::DEMO: return "DEMO";
        case ExchangeEnvironment::TESTNET: return "TESTNET";
        case ExchangeEnvironment::PRODUCTION: return "PROD";
    }
    return "DEMO";
}

} // namespace spotpilot
