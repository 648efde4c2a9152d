#pragma once

#include <string>

namespace spotpilot {
namespace engine {

// 엔진 설정
struct EngineConfig {
    std::string symbol;
    std::string quote_coin;

    // 진입 실패 후 재진입 금지 시간
    int entry_cooldown_seconds;

    // 체결 내역 조회 (시장가 체결이 내역에 반영되기까지 지연이 있음)
    int fill_lookup_attempts;
    int fill_lookup_delay_ms;

    EngineConfig()
        : symbol("BTCUSDT")
        , quote_coin("USDT")
        , entry_cooldown_seconds(60)
        , fill_lookup_attempts(3)
        , fill_lookup_delay_ms(500)
    {}
};

} // namespace engine
} // namespace spotpilot
