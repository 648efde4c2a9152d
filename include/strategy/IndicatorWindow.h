#pragma once

#include "common/Types.h"
#include "strategy/IndicatorSnapshot.h"

#include <deque>
#include <vector>

namespace spotpilot {
namespace strategy {

// 확정 봉 롤링 윈도우 + 지표 스냅샷
// EMA 9/21, RSI/ATR/ADX 14 (Wilder), 거래량 SMA 20
class IndicatorWindow {
public:
    static constexpr size_t MAX_BARS = 1000;
    static constexpr size_t MIN_BARS = 25;

    explicit IndicatorWindow(int fast_period = 9, int slow_period = 21);

    // 같은 시작 시각의 봉은 교체, 과거 봉은 무시
    void add(const Candle& candle);
    void seed(const std::vector<Candle>& candles);

    // MIN_BARS 미만이면 빈 스냅샷
    IndicatorSnapshot snapshot() const;

    size_t size() const { return candles_.size(); }
    long long lastPeriodStart() const;

    // ===== 지표 계산 (Wilder's Smoothing) =====
    static double calculateEMA(const std::vector<double>& values, int period);
    static double calculateSMA(const std::vector<double>& values, int period);
    // 데이터 부족 시 50
    static double calculateRSI(const std::vector<double>& closes, int period = 14);
    // 데이터 부족 시 0
    static double calculateATR(const std::vector<Candle>& candles, int period = 14);
    static double calculateADX(const std::vector<Candle>& candles, int period = 14);

private:
    int fast_period_;
    int slow_period_;
    std::deque<Candle> candles_;
};

} // namespace strategy
} // namespace spotpilot
