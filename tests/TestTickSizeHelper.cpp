#include "common/TickSizeHelper.h"

#include <cassert>
#include <cmath>
#include <iostream>

using namespace spotpilot::common;

namespace {
bool near(double a, double b) {
    return std::fabs(a - b) < 1e-12;
}
}

int main() {
    assert(decimalsForStep(0.0001) == 4);
    assert(decimalsForStep(0.5) == 1);
    assert(decimalsForStep(1.0) == 0);
    assert(decimalsForStep(0.000001) == 6);

    // 부동소수점 오차로 한 단위 더 올라가지 않음
    assert(near(roundUpToStep(0.0003, 0.0001), 0.0003));
    assert(near(roundUpToStep(0.00012, 0.0001), 0.0002));
    assert(near(roundUpToStep(5.0 / 30000.0, 0.0001), 0.0002));

    assert(near(roundDownToStep(0.00019, 0.0001), 0.0001));
    assert(near(roundDownToStep(0.0003, 0.0001), 0.0003));
    assert(near(roundDownToStep(0.00005, 0.0001), 0.0));

    assert(near(roundToStep(100.304, 0.01), 100.30));
    assert(near(roundToStep(100.305001, 0.01), 100.31));
    assert(near(roundToStep(17.3, 0.5), 17.5));

    assert(isMultipleOfStep(0.0003, 0.0001));
    assert(!isMultipleOfStep(0.00035, 0.0001));

    assert(formatFixed(0.0002, 4) == "0.0002");
    assert(formatFixed(5.0, 2) == "5.00");
    assert(formatFixed(-0.0000001, 4) == "0.0000");
    assert(formatFixed(1e-7, 8) == "0.00000010");

    assert(priceToString(30000.123, 0.01) == "30000.12");
    assert(priceToString(17.26, 0.5) == "17.5");

    // 1e-9 이하 단위도 자릿수를 잃지 않음
    assert(decimalsForStep(1e-9) == 9);
    assert(decimalsForStep(1e-10) == 10);
    assert(decimalsForStep(2.5e-9) == 10);
    assert(decimalsForStep(2.5) == 1);
    assert(decimalsForStep(10.0) == 0);
    assert(priceToString(1.23e-7, 1e-9) == "0.000000123");
    assert(formatFixed(roundDownToStep(3.4567e-8, 1e-9), decimalsForStep(1e-9)) == "0.000000034");
    assert(formatFixed(roundUpToStep(3.4567e-8, 1e-9), decimalsForStep(1e-9)) == "0.000000035");

    std::cout << "[TEST] TickSizeHelper PASSED\n";
    return 0;
}
