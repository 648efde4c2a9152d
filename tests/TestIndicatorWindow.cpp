#include "strategy/IndicatorWindow.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace spotpilot;
using strategy::IndicatorWindow;
namespace ind = spotpilot::strategy::indicator;

namespace {
// 매 봉 1 씩 오르는 추세
std::vector<Candle> risingSeries(size_t count, long long start_ms = 1700000000000LL) {
    std::vector<Candle> candles;
    for (size_t i = 0; i < count; ++i) {
        const double base = 100.0 + static_cast<double>(i);
        candles.emplace_back(start_ms + static_cast<long long>(i) * 60000, base, base + 1.5, base - 0.5,
                             base + 1.0, 10.0 + static_cast<double>(i), true);
    }
    return candles;
}
}

int main() {
    // 계산기
    {
        assert(IndicatorWindow::calculateSMA({1, 2, 3, 4}, 2) == 3.5);
        assert(IndicatorWindow::calculateSMA({1, 2}, 3) == 0.0);
        assert(IndicatorWindow::calculateEMA({5, 5, 5, 5}, 3) == 5.0);
        assert(IndicatorWindow::calculateRSI({1, 2, 3}, 14) == 50.0);
        assert(IndicatorWindow::calculateATR(risingSeries(5), 14) == 0.0);
    }

    // 25봉 미만이면 빈 스냅샷
    {
        IndicatorWindow window;
        window.seed(risingSeries(24));
        assert(window.size() == 24);
        assert(window.snapshot().empty());
    }

    // 상승 추세: EMA 9 > EMA 21, RSI 100, ADX 강함, ATR 2
    {
        IndicatorWindow window;
        window.seed(risingSeries(60));
        const auto snap = window.snapshot();
        assert(!snap.empty());
        assert(*snap.get(ind::EMA_FAST) > *snap.get(ind::EMA_SLOW));
        assert(*snap.get(ind::RSI) == 100.0);
        assert(*snap.get(ind::ADX) > 25.0);
        assert(std::fabs(*snap.get(ind::ATR) - 2.0) < 1e-9);
        assert(*snap.get(ind::VOLUME) == 69.0);
        assert(std::fabs(*snap.get(ind::VOLUME_SMA) - 59.5) < 1e-9);
        assert(window.lastPeriodStart() == 1700000000000LL + 59 * 60000);
    }

    // 미확정 봉은 seed 에서 제외, 같은 시작 시각은 교체, 과거 봉은 무시
    {
        auto candles = risingSeries(3);
        candles[2].confirmed = false;
        IndicatorWindow window;
        window.seed(candles);
        assert(window.size() == 2);

        Candle replacement = candles[1];
        replacement.close = 999.0;
        window.add(replacement);
        assert(window.size() == 2);

        window.add(candles[0]);
        assert(window.size() == 2);
        assert(window.lastPeriodStart() == candles[1].period_start_ms);
    }

    // 최대 1000봉 유지
    {
        IndicatorWindow window;
        window.seed(risingSeries(1005));
        assert(window.size() == IndicatorWindow::MAX_BARS);
    }

    std::cout << "[TEST] IndicatorWindow PASSED\n";
    return 0;
}
