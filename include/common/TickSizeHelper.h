#pragma once
// ===================================================================
// 수량 단위(qtyStep) / 호가 단위(tickSize) 헬퍼
//
// 거래소 필터는 "0.0001" 같은 단위로 내려오며, 단위의 배수가 아닌 수량이나
// 가격을 보내면 주문이 거절된다. 나눗셈 결과의 부동소수점 오차로 한 단위가
// 더해지거나 빠지지 않도록 STEP_EPSILON 만큼 보정한 뒤 올림/내림한다.
// ===================================================================

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace spotpilot {
namespace common {

constexpr double STEP_EPSILON = 1e-9;

// 단위가 암시하는 소수 자릿수 (0.0001 -> 4, 0.5 -> 1, 1 -> 0, 1e-9 -> 9)
// 정수부가 1 이상이 될 때까지 키운 뒤 나머지는 상대 오차로 판정
inline int decimalsForStep(double step) {
    if (step <= 0.0) return 0;
    int decimals = 0;
    double scaled = step;
    while (decimals < 15 &&
           (std::round(scaled) < 1.0 || std::fabs(scaled - std::round(scaled)) > STEP_EPSILON * scaled)) {
        scaled *= 10.0;
        decimals++;
    }
    return decimals;
}

inline double roundToDecimals(double value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

// 매수용: 단위 배수로 올림 (신호보다 적게 사지 않음)
inline double roundUpToStep(double value, double step) {
    if (step <= 0.0) return value;
    const double units = std::ceil(value / step - STEP_EPSILON);
    return roundToDecimals(units * step, decimalsForStep(step));
}

// 매도용: 단위 배수로 내림 (보유량 초과 매도 방지)
inline double roundDownToStep(double value, double step) {
    if (step <= 0.0) return value;
    const double units = std::floor(value / step + STEP_EPSILON);
    return roundToDecimals(units * step, decimalsForStep(step));
}

// 가장 가까운 배수 (조건부 주문 트리거 가격)
inline double roundToStep(double value, double step) {
    if (step <= 0.0) return value;
    return roundToDecimals(std::round(value / step) * step, decimalsForStep(step));
}

inline bool isMultipleOfStep(double value, double step) {
    if (step <= 0.0) return true;
    const double units = value / step;
    return std::fabs(units - std::round(units)) < 1e-6;
}

// 지수 표기 없이 고정 소수점 문자열 생성 (주문 전송용)
inline std::string formatFixed(double value, int decimals) {
    if (decimals < 0) decimals = 0;
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    std::string out(buf);
    if (out == "-0" || out.rfind("-0.", 0) == 0) {
        bool all_zero = out.find_first_not_of("-0.") == std::string::npos;
        if (all_zero) out.erase(0, 1);
    }
    return out;
}

// 호가 단위에 맞춘 가격 문자열
inline std::string priceToString(double price, double tick) {
    return formatFixed(roundToStep(price, tick), decimalsForStep(tick));
}

} // namespace common
} // namespace spotpilot
