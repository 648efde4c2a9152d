#pragma once

#include <map>
#include <optional>
#include <string>

namespace spotpilot {
namespace strategy {

// 지표 이름 (IndicatorWindow 가 채우고 TradeEngine 이 읽음)
namespace indicator {
constexpr const char* EMA_FAST = "ema_fast";
constexpr const char* EMA_SLOW = "ema_slow";
constexpr const char* ADX = "adx14";
constexpr const char* RSI = "rsi14";
constexpr const char* ATR = "atr14";
constexpr const char* VOLUME = "volume";
constexpr const char* VOLUME_SMA = "volumeSMA";
}

// 이름 -> 값. 계산되지 않은 지표는 비어 있음
class IndicatorSnapshot {
public:
    void set(const std::string& name, double value) { values_[name] = value; }

    std::optional<double> get(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    double valueOr(const std::string& name, double fallback) const {
        return get(name).value_or(fallback);
    }

    bool empty() const { return values_.empty(); }
    const std::map<std::string, double>& values() const { return values_; }

private:
    std::map<std::string, double> values_;
};

} // namespace strategy
} // namespace spotpilot
