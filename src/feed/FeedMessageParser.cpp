#include "feed/FeedMessageParser.h"

#include "common/Errors.h"
#include "exchange/BybitResponseParser.h"

#include <nlohmann/json.hpp>

namespace spotpilot {
namespace feed {
namespace {
bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

long long timestampOf(const nlohmann::json& message, long long fallback) {
    auto it = message.find("ts");
    if (it != message.end() && it->is_number()) {
        return it->get<long long>();
    }
    return fallback;
}
}

FeedMessageParser::FeedMessageParser(std::string symbol)
    : symbol_(std::move(symbol)) {}

std::string FeedMessageParser::tickerTopic(const std::string& symbol) {
    return "tickers." + symbol;
}

std::string FeedMessageParser::klineTopic(const std::string& interval, const std::string& symbol) {
    return "kline." + interval + "." + symbol;
}

ParsedFeedMessage FeedMessageParser::parse(const std::string& raw, long long received_at_ms) const {
    ParsedFeedMessage parsed;

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::exception& e) {
        throw InvalidResponse(std::string("malformed push message: ") + e.what());
    }

    if (!message.is_object()) {
        return parsed;
    }

    // 구독 응답 / pong
    if (message.contains("op") || !message.contains("topic")) {
        return parsed;
    }

    const std::string topic = message.value("topic", std::string());
    if (!endsWith(topic, "." + symbol_)) {
        return parsed;
    }

    const auto& data = message["data"];

    if (topic.rfind("tickers.", 0) == 0) {
        // spot 은 객체, 일부 카테고리는 배열
        auto handleTicker = [&](const nlohmann::json& item) {
            const double price = exchange::bybit::toDouble(item, "lastPrice");
            if (price <= 0.0) {
                return;
            }
            Tick tick;
            tick.symbol = symbol_;
            tick.price = price;
            tick.observed_at_ms = timestampOf(message, received_at_ms);
            parsed.ticks.push_back(tick);
        };
        if (data.is_array()) {
            for (const auto& item : data) handleTicker(item);
        } else if (data.is_object()) {
            handleTicker(data);
        }
        return parsed;
    }

    if (topic.rfind("kline.", 0) == 0 && data.is_array()) {
        for (const auto& item : data) {
            if (!item.is_object() || !item.value("confirm", false)) {
                continue;
            }
            Candle candle;
            candle.period_start_ms = item.value("start", 0LL);
            candle.open = exchange::bybit::toDouble(item, "open");
            candle.high = exchange::bybit::toDouble(item, "high");
            candle.low = exchange::bybit::toDouble(item, "low");
            candle.close = exchange::bybit::toDouble(item, "close");
            candle.volume = exchange::bybit::toDouble(item, "volume");
            candle.confirmed = true;
            parsed.candles.push_back(candle);
        }
    }

    return parsed;
}

} // namespace feed
} // namespace spotpilot
