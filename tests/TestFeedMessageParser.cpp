#include "feed/FeedMessageParser.h"
#include "common/Errors.h"
#include "network/BybitPublicWebSocketClient.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <iostream>

using namespace spotpilot;
using feed::FeedMessageParser;

int main() {
    FeedMessageParser parser("BTCUSDT");

    assert(FeedMessageParser::tickerTopic("BTCUSDT") == "tickers.BTCUSDT");
    assert(FeedMessageParser::klineTopic("1", "BTCUSDT") == "kline.1.BTCUSDT");

    // 구독 응답 / pong 은 무시
    {
        assert(parser.parse(R"({"success":true,"ret_msg":"subscribe","conn_id":"x","op":"subscribe"})", 1).empty());
        assert(parser.parse(R"({"success":true,"ret_msg":"pong","op":"ping"})", 1).empty());
        assert(parser.parse(R"([1,2,3])", 1).empty());
    }

    // 티커 (spot 은 data 가 객체)
    {
        const auto parsed = parser.parse(R"({
            "topic": "tickers.BTCUSDT", "ts": 1700000000123, "type": "snapshot",
            "data": {"symbol": "BTCUSDT", "lastPrice": "30001.5", "volume24h": "100"}
        })", 5);
        assert(parsed.ticks.size() == 1);
        assert(parsed.candles.empty());
        assert(parsed.ticks[0].price == 30001.5);
        assert(parsed.ticks[0].observed_at_ms == 1700000000123LL);
        assert(parsed.ticks[0].symbol == "BTCUSDT");
    }

    // ts 가 없으면 수신 시각
    {
        const auto parsed = parser.parse(R"({"topic": "tickers.BTCUSDT", "data": [{"lastPrice": "10"}]})", 77);
        assert(parsed.ticks.size() == 1);
        assert(parsed.ticks[0].observed_at_ms == 77);
    }

    // 다른 심볼은 무시
    {
        assert(parser.parse(R"({"topic": "tickers.ETHUSDT", "data": {"lastPrice": "2000"}})", 1).empty());
    }

    // 봉: 확정된 것만
    {
        const auto parsed = parser.parse(R"({
            "topic": "kline.1.BTCUSDT", "ts": 1700000060001, "type": "snapshot",
            "data": [
                {"start": 1700000000000, "end": 1700000059999, "interval": "1",
                 "open": "100", "high": "101", "low": "99", "close": "100.5", "volume": "12.5",
                 "confirm": true, "timestamp": 1700000060001},
                {"start": 1700000060000, "end": 1700000119999, "interval": "1",
                 "open": "100.5", "high": "100.6", "low": "100.4", "close": "100.5", "volume": "0.1",
                 "confirm": false, "timestamp": 1700000060001}
            ]
        })", 1);
        assert(parsed.candles.size() == 1);
        const auto& candle = parsed.candles.front();
        assert(candle.period_start_ms == 1700000000000LL);
        assert(candle.open == 100.0);
        assert(candle.high == 101.0);
        assert(candle.low == 99.0);
        assert(candle.close == 100.5);
        assert(candle.volume == 12.5);
        assert(candle.confirmed);
    }

    // 미확정 봉만 있으면 아무것도 없음
    {
        assert(parser.parse(R"({"topic": "kline.1.BTCUSDT", "data": [{"start": 1, "close": "1", "confirm": false}]})", 1).empty());
    }

    // 깨진 JSON
    {
        bool thrown = false;
        try {
            parser.parse("{not json", 1);
        } catch (const InvalidResponse&) {
            thrown = true;
        }
        assert(thrown);
    }

    // 구독 메시지
    {
        const auto message = nlohmann::json::parse(
            network::BybitPublicWebSocketClient::buildSubscribeMessage({"kline.1.BTCUSDT"}));
        assert(message["op"] == "subscribe");
        assert(message["args"].size() == 1);
        assert(message["args"][0] == "kline.1.BTCUSDT");
    }

    std::cout << "[TEST] FeedMessageParser PASSED\n";
    return 0;
}
