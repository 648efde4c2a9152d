#pragma once

#include <stdexcept>
#include <string>

namespace spotpilot {

enum class ErrorKind {
    TRANSIENT_NETWORK,
    EXCHANGE_REJECTED,
    AUTH,
    INSUFFICIENT_BALANCE,
    PRICE_UNAVAILABLE,
    INVALID_RESPONSE,
    STALE_FEED
};

class TradingError : public std::runtime_error {
public:
    TradingError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// 연결/타임아웃/5xx 계열. request_sent=false 이면 요청이 클라이언트를 떠나기 전 실패
class TransientNetworkError : public TradingError {
public:
    TransientNetworkError(const std::string& message, bool request_sent,
                          int http_status = 0, bool rate_limited = false)
        : TradingError(ErrorKind::TRANSIENT_NETWORK, message)
        , request_sent_(request_sent)
        , http_status_(http_status)
        , rate_limited_(rate_limited) {}

    bool requestSent() const noexcept { return request_sent_; }
    int httpStatus() const noexcept { return http_status_; }
    bool rateLimited() const noexcept { return rate_limited_; }

private:
    bool request_sent_;
    int http_status_;
    bool rate_limited_;
};

// 거래소가 명시적으로 거절 (retCode != 0). 재시도하지 않음
class ExchangeRejected : public TradingError {
public:
    ExchangeRejected(int code, const std::string& exchange_message)
        : TradingError(ErrorKind::EXCHANGE_REJECTED,
                       "exchange rejected request (code " + std::to_string(code) + "): " + exchange_message)
        , code_(code)
        , exchange_message_(exchange_message) {}

    int code() const noexcept { return code_; }
    const std::string& exchangeMessage() const noexcept { return exchange_message_; }

private:
    int code_;
    std::string exchange_message_;
};

class AuthError : public TradingError {
public:
    AuthError(int code, const std::string& message)
        : TradingError(ErrorKind::AUTH, "authorization failed (code " + std::to_string(code) + "): " + message)
        , code_(code) {}

    int code() const noexcept { return code_; }

private:
    int code_;
};

// 매도 수량이 최소 조건을 만족할 수 없음. 거래소로 전송되지 않음
class InsufficientBalance : public TradingError {
public:
    InsufficientBalance(const std::string& message, double requested, double available)
        : TradingError(ErrorKind::INSUFFICIENT_BALANCE, message)
        , requested_(requested)
        , available_(available) {}

    double requested() const noexcept { return requested_; }
    double available() const noexcept { return available_; }

private:
    double requested_;
    double available_;
};

class PriceUnavailable : public TradingError {
public:
    explicit PriceUnavailable(const std::string& message)
        : TradingError(ErrorKind::PRICE_UNAVAILABLE, message) {}
};

class InvalidResponse : public TradingError {
public:
    explicit InvalidResponse(const std::string& message)
        : TradingError(ErrorKind::INVALID_RESPONSE, message) {}
};

// 피드 내부 신호 - primary 스트림 전환에만 사용
class StaleFeedError : public TradingError {
public:
    StaleFeedError(const std::string& message, long long silent_ms)
        : TradingError(ErrorKind::STALE_FEED, message)
        , silent_ms_(silent_ms) {}

    long long silentMs() const noexcept { return silent_ms_; }

private:
    long long silent_ms_;
};

} // namespace spotpilot
