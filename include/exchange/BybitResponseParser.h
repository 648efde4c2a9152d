#pragma once

#include "common/Types.h"
#include "network/IHttpClient.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace spotpilot {
namespace exchange {
namespace bybit {

// HTTP 상태 + retCode 를 해석하고 result 객체를 돌려준다.
// 실패는 AuthError / TransientNetworkError / ExchangeRejected / InvalidResponse 로 던짐
nlohmann::json unwrapResult(const network::HttpResponse& response);

// retCode != 0 분류
[[noreturn]] void throwForRetCode(int code, const std::string& message);

WalletBalance parseWalletBalance(const nlohmann::json& result, const std::string& account_type);
TickerSnapshot parseTicker(const nlohmann::json& result, const std::string& symbol);
SymbolFilters parseSymbolFilters(const nlohmann::json& result, const std::string& symbol,
                                 const std::string& category);
OrderAck parseOrderAck(const nlohmann::json& result);
std::vector<ExecutionFill> parseExecutions(const nlohmann::json& result);
std::vector<OpenOrder> parseOpenOrders(const nlohmann::json& result);

// 봉 목록 (거래소는 최신순으로 내려줌) -> 시간 오름차순.
// period_start + interval <= now_ms 이면 확정 봉
std::vector<Candle> parseCandles(const nlohmann::json& result, long long interval_ms, long long now_ms);

// "1", "5", "60", "D" ... -> 밀리초. 알 수 없는 값은 std::invalid_argument
long long intervalToMs(const std::string& interval);

// 문자열/숫자 모두 허용 ("" 또는 누락은 fallback)
double toDouble(const nlohmann::json& object, const char* key, double fallback = 0.0);

// 정수(자릿수) 또는 "0.0001" 같은 단위 문자열 -> 소수 자릿수
int precisionToDecimals(const nlohmann::json& value, int fallback);

OrderSide parseSide(const std::string& side);

} // namespace bybit
} // namespace exchange
} // namespace spotpilot
