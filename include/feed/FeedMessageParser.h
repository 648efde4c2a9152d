#pragma once

#include "common/Types.h"

#include <string>
#include <vector>

namespace spotpilot {
namespace feed {

struct ParsedFeedMessage {
    std::vector<Tick> ticks;
    std::vector<Candle> candles;   // 확정 봉만

    bool empty() const { return ticks.empty() && candles.empty(); }
};

// 공개 스트림 원문 -> Tick / 확정 Candle
// 구독 응답, pong 등 제어 프레임은 빈 결과. 깨진 JSON 은 InvalidResponse
class FeedMessageParser {
public:
    explicit FeedMessageParser(std::string symbol);

    ParsedFeedMessage parse(const std::string& raw, long long received_at_ms) const;

    static std::string tickerTopic(const std::string& symbol);
    static std::string klineTopic(const std::string& interval, const std::string& symbol);

private:
    std::string symbol_;
};

} // namespace feed
} // namespace spotpilot
