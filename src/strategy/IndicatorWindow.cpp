#include "strategy/IndicatorWindow.h"

#include <algorithm>
#include <cmath>

namespace spotpilot {
namespace strategy {
namespace {
double trueRange(const Candle& current, const Candle& prev) {
    const double tr1 = current.high - current.low;
    const double tr2 = std::abs(current.high - prev.close);
    const double tr3 = std::abs(current.low - prev.close);
    return std::max({tr1, tr2, tr3});
}
}

IndicatorWindow::IndicatorWindow(int fast_period, int slow_period)
    : fast_period_(fast_period)
    , slow_period_(slow_period) {}

void IndicatorWindow::add(const Candle& candle) {
    if (!candles_.empty()) {
        const long long last = candles_.back().period_start_ms;
        if (candle.period_start_ms < last) {
            return;
        }
        if (candle.period_start_ms == last) {
            candles_.back() = candle;
            return;
        }
    }

    candles_.push_back(candle);
    while (candles_.size() > MAX_BARS) {
        candles_.pop_front();
    }
}

void IndicatorWindow::seed(const std::vector<Candle>& candles) {
    for (const auto& candle : candles) {
        if (candle.confirmed) {
            add(candle);
        }
    }
}

long long IndicatorWindow::lastPeriodStart() const {
    return candles_.empty() ? -1 : candles_.back().period_start_ms;
}

IndicatorSnapshot IndicatorWindow::snapshot() const {
    IndicatorSnapshot snap;
    if (candles_.size() < MIN_BARS) {
        return snap;
    }

    std::vector<Candle> bars(candles_.begin(), candles_.end());
    std::vector<double> closes;
    std::vector<double> volumes;
    closes.reserve(bars.size());
    volumes.reserve(bars.size());
    for (const auto& bar : bars) {
        closes.push_back(bar.close);
        volumes.push_back(bar.volume);
    }

    snap.set(indicator::EMA_FAST, calculateEMA(closes, fast_period_));
    snap.set(indicator::EMA_SLOW, calculateEMA(closes, slow_period_));
    snap.set(indicator::RSI, calculateRSI(closes, 14));
    snap.set(indicator::ATR, calculateATR(bars, 14));
    snap.set(indicator::ADX, calculateADX(bars, 14));
    snap.set(indicator::VOLUME, volumes.back());
    snap.set(indicator::VOLUME_SMA, calculateSMA(volumes, 20));
    return snap;
}

// EMA - 첫 period 개의 SMA 로 시작
double IndicatorWindow::calculateEMA(const std::vector<double>& values, int period) {
    if (values.empty()) return 0.0;
    if (values.size() < static_cast<size_t>(period)) return values.back();

    const double multiplier = 2.0 / (period + 1.0);

    double ema = 0.0;
    for (int i = 0; i < period; ++i) {
        ema += values[i];
    }
    ema /= period;

    for (size_t i = period; i < values.size(); ++i) {
        ema = (values[i] - ema) * multiplier + ema;
    }
    return ema;
}

// 최신 period 개 평균
double IndicatorWindow::calculateSMA(const std::vector<double>& values, int period) {
    if (values.size() < static_cast<size_t>(period)) return 0.0;

    double sum = 0.0;
    for (size_t i = values.size() - period; i < values.size(); ++i) {
        sum += values[i];
    }
    return sum / period;
}

double IndicatorWindow::calculateRSI(const std::vector<double>& closes, int period) {
    if (closes.size() < static_cast<size_t>(period + 1)) {
        return 50.0;
    }

    double avg_gain = 0.0;
    double avg_loss = 0.0;
    for (int i = 1; i <= period; ++i) {
        const double change = closes[i] - closes[i - 1];
        if (change > 0) avg_gain += change;
        else avg_loss += std::abs(change);
    }
    avg_gain /= period;
    avg_loss /= period;

    for (size_t i = period + 1; i < closes.size(); ++i) {
        const double change = closes[i] - closes[i - 1];
        const double gain = change > 0 ? change : 0.0;
        const double loss = change < 0 ? std::abs(change) : 0.0;
        avg_gain = ((avg_gain * (period - 1)) + gain) / period;
        avg_loss = ((avg_loss * (period - 1)) + loss) / period;
    }

    if (avg_loss < 0.0000001) return 100.0;

    const double rs = avg_gain / avg_loss;
    return 100.0 - (100.0 / (1.0 + rs));
}

double IndicatorWindow::calculateATR(const std::vector<Candle>& candles, int period) {
    if (candles.size() < static_cast<size_t>(period + 1)) {
        return 0.0;
    }

    std::vector<double> tr_values;
    tr_values.reserve(candles.size());
    for (size_t i = 1; i < candles.size(); ++i) {
        tr_values.push_back(trueRange(candles[i], candles[i - 1]));
    }

    double atr = 0.0;
    for (int i = 0; i < period; ++i) atr += tr_values[i];
    atr /= period;

    for (size_t i = period; i < tr_values.size(); ++i) {
        atr = ((atr * (period - 1)) + tr_values[i]) / period;
    }
    return atr;
}

// ADX - TR/DM 을 Wilder 합산 평활, DX 도 Wilder 평균
// DX 가 period 개 미만이면 가용 DX 의 평균
double IndicatorWindow::calculateADX(const std::vector<Candle>& candles, int period) {
    if (candles.size() < static_cast<size_t>(period + 1)) return 0.0;

    std::vector<double> tr_vec, dm_plus_vec, dm_minus_vec;
    tr_vec.reserve(candles.size());
    dm_plus_vec.reserve(candles.size());
    dm_minus_vec.reserve(candles.size());

    for (size_t i = 1; i < candles.size(); ++i) {
        tr_vec.push_back(trueRange(candles[i], candles[i - 1]));

        const double up_move = candles[i].high - candles[i - 1].high;
        const double down_move = candles[i - 1].low - candles[i].low;
        dm_plus_vec.push_back(up_move > down_move && up_move > 0 ? up_move : 0.0);
        dm_minus_vec.push_back(down_move > up_move && down_move > 0 ? down_move : 0.0);
    }

    auto smooth = [period](const std::vector<double>& vec) {
        std::vector<double> smoothed;
        if (vec.size() < static_cast<size_t>(period)) return smoothed;

        double sum = 0.0;
        for (int i = 0; i < period; ++i) sum += vec[i];
        smoothed.push_back(sum);

        double prev = sum;
        for (size_t i = period; i < vec.size(); ++i) {
            const double current = prev - (prev / period) + vec[i];
            smoothed.push_back(current);
            prev = current;
        }
        return smoothed;
    };

    const auto tr_smooth = smooth(tr_vec);
    const auto dm_plus_smooth = smooth(dm_plus_vec);
    const auto dm_minus_smooth = smooth(dm_minus_vec);

    const size_t len = std::min({tr_smooth.size(), dm_plus_smooth.size(), dm_minus_smooth.size()});
    if (len == 0) return 0.0;

    std::vector<double> dx_vec;
    dx_vec.reserve(len);
    for (size_t i = 0; i < len; ++i) {
        const double tr = tr_smooth[i];
        if (tr == 0) {
            dx_vec.push_back(0.0);
            continue;
        }
        const double di_plus = (dm_plus_smooth[i] / tr) * 100.0;
        const double di_minus = (dm_minus_smooth[i] / tr) * 100.0;
        const double sum_di = di_plus + di_minus;
        dx_vec.push_back(sum_di == 0 ? 0.0 : (std::abs(di_plus - di_minus) / sum_di) * 100.0);
    }

    const size_t seed_count = std::min(dx_vec.size(), static_cast<size_t>(period));
    double adx = 0.0;
    for (size_t i = 0; i < seed_count; ++i) adx += dx_vec[i];
    adx /= static_cast<double>(seed_count);

    for (size_t i = seed_count; i < dx_vec.size(); ++i) {
        adx = ((adx * (period - 1)) + dx_vec[i]) / period;
    }
    return adx;
}

} // namespace strategy
} // namespace spotpilot
