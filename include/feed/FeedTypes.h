#pragma once

#include "common/Types.h"

#include <chrono>
#include <string>

namespace spotpilot {
namespace feed {

enum class FeedMode { TICK, CANDLE };

enum class FeedState {
    DISCONNECTED,
    STREAMING_PRIMARY,
    STREAMING_FALLBACK
};

enum class FeedSource { PRIMARY, FALLBACK };

struct FeedEvent {
    enum class Kind { TICK, CANDLE };

    Kind kind = Kind::TICK;
    FeedSource source = FeedSource::PRIMARY;
    Tick tick;
    Candle candle;

    static FeedEvent ofTick(const Tick& tick, FeedSource source) {
        FeedEvent event;
        event.kind = Kind::TICK;
        event.source = source;
        event.tick = tick;
        return event;
    }

    static FeedEvent ofCandle(const Candle& candle, FeedSource source) {
        FeedEvent event;
        event.kind = Kind::CANDLE;
        event.source = source;
        event.candle = candle;
        return event;
    }
};

struct FeedConfig {
    std::string symbol = "BTCUSDT";
    FeedMode mode = FeedMode::CANDLE;
    std::string interval = "1";           // 봉 간격 (분)

    // DEMO 계정은 푸시 스트림 없이 바로 폴링
    bool primary_enabled = true;

    std::chrono::milliseconds stale_threshold{70000};
    std::chrono::milliseconds watchdog_interval{5000};
    std::chrono::milliseconds poll_interval{30000};
    std::chrono::milliseconds join_timeout{2000};
    int poll_candle_limit = 5;

    // 틱 모드 기본값: 10초 무응답이면 전환, 2초 간격 감시/폴링
    static FeedConfig tickDefaults(const std::string& symbol) {
        FeedConfig config;
        config.symbol = symbol;
        config.mode = FeedMode::TICK;
        config.stale_threshold = std::chrono::milliseconds(10000);
        config.watchdog_interval = std::chrono::milliseconds(2000);
        config.poll_interval = std::chrono::milliseconds(2000);
        return config;
    }

    // 봉 모드 기본값: 1분봉 + 여유 10초
    static FeedConfig candleDefaults(const std::string& symbol, const std::string& interval = "1") {
        FeedConfig config;
        config.symbol = symbol;
        config.mode = FeedMode::CANDLE;
        config.interval = interval;
        return config;
    }
};

inline const char* toString(FeedState state) {
    switch (state) {
        case FeedState::DISCONNECTED: return "DISCONNECTED";
        case FeedState::STREAMING_PRIMARY: return "STREAMING_PRIMARY";
        case FeedState::STREAMING_FALLBACK: return "STREAMING_FALLBACK";
    }
    return "DISCONNECTED";
}

} // namespace feed
} // namespace spotpilot
