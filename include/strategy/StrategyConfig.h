#pragma once

namespace spotpilot {
namespace strategy {

enum class StopLossMode {
    PERCENT,    // entry * (1 - sl_pct)
    ATR         // entry - ATR * multiplier (ATR 없으면 PERCENT)
};

struct ScalpingStrategyConfig {
    double risk_usdt = 5.0;             // 진입당 투입 금액 (quote)

    // Profit/Loss
    double take_profit_pct = 0.003;     // 0.3%
    double stop_loss_pct = 0.005;       // 0.5%
    StopLossMode stop_loss_mode = StopLossMode::ATR;
    double atr_multiplier = 1.5;
    int max_open_minutes = 20;

    // Entry filters
    double adx_threshold = 25.0;
    double rsi_threshold = 68.0;
    bool use_volume_filter = true;
    double volume_multiplier = 1.2;

    int fast_ema_period = 9;
    int slow_ema_period = 21;
};

} // namespace strategy
} // namespace spotpilot
