#pragma once

#include "common/Types.h"
#include "execution/RetryPolicy.h"

#include <string>
#include <vector>

namespace spotpilot {
namespace exchange {

struct GatewayConfig {
    ExchangeEnvironment environment = ExchangeEnvironment::DEMO;
    std::string category = "spot";

    // 설정된 계정 유형을 먼저 시도하고, 실패하면 나머지 후보를 순서대로
    std::string account_type = "UNIFIED";
    std::vector<std::string> account_type_candidates = {"UNIFIED", "SPOT", "CONTRACT"};

    int recv_window_ms = 5000;
    int timeout_seconds = 20;

    execution::RetryPolicy read_policy = execution::RetryPolicy::standard();
    // 주문 생성/취소는 요청이 나가기 전 실패만 재시도
    execution::RetryPolicy write_policy = execution::RetryPolicy::preSubmissionOnly();
};

inline std::string restBaseUrl(ExchangeEnvironment env) {
    switch (env) {
        case ExchangeEnvironment::DEMO: return "https://api-demo.bybit.com";
        case ExchangeEnvironment::TESTNET: return "https://api-testnet.bybit.com";
        case ExchangeEnvironment::PRODUCTION: return "https://api.bybit.com";
    }
    return "https://api-demo.bybit.com";
}

// DEMO 는 공개 푸시 스트림이 없음 (빈 문자열)
inline std::string streamHost(ExchangeEnvironment env) {
    switch (env) {
        case ExchangeEnvironment::DEMO: return "";
        case ExchangeEnvironment::TESTNET: return "stream-testnet.bybit.com";
        case ExchangeEnvironment::PRODUCTION: return "stream.bybit.com";
    }
    return "";
}

inline std::string streamTarget(const std::string& category) {
    return "/v5/public/" + category;
}

} // namespace exchange
} // namespace spotpilot
