#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <utility>

#include "common/Errors.h"
#include "common/Logger.h"

namespace spotpilot {
namespace execution {

// 재시도 정책 값 객체 - 전송 계층과 무관하게 게이트웨이에 주입
struct RetryPolicy {
    using RetryablePredicate = std::function<bool(const TradingError&)>;

    int max_attempts = 3;
    std::chrono::milliseconds initial_backoff{800};
    std::chrono::milliseconds max_backoff{6000};
    double backoff_multiplier = 2.0;
    RetryablePredicate is_retryable;

    // attempt 는 1부터 시작 (첫 실패 후 대기 시간 = initial_backoff)
    std::chrono::milliseconds backoffFor(int attempt) const;
    bool shouldRetry(const TradingError& error, int attempt) const;

    // 연결/타임아웃/5xx + 재시도 태그가 붙은 rate limit
    static RetryPolicy standard();
    // 요청이 클라이언트를 떠나기 전에 실패한 경우만 (주문 생성/취소)
    static RetryPolicy preSubmissionOnly();
    static RetryPolicy noRetry();

    static bool isTransient(const TradingError& error);
    static bool isPreSubmission(const TradingError& error);
};

// 현재 스레드의 중단 신호. 장기 실행 스레드(피드 폴러)가 자신의 stop 대기를 설치하면
// 재시도 대기와 진행 중인 HTTP 전송이 그 신호로 끝난다.
class RetryInterrupt {
public:
    // duration 동안 대기, 중단 신호가 오면 즉시 true
    using Waiter = std::function<bool(std::chrono::milliseconds)>;

    class Scope {
    public:
        explicit Scope(Waiter waiter);
        ~Scope();

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        Waiter previous_;
    };

    // 설치된 신호가 없으면 그냥 sleep. 중단되면 true
    static bool sleepFor(std::chrono::milliseconds duration);
    static bool requested();
};

class RetryExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryExecutor()
        : sleeper_([](std::chrono::milliseconds d) { RetryInterrupt::sleepFor(d); }) {}

    explicit RetryExecutor(Sleeper sleeper) : sleeper_(std::move(sleeper)) {}

    // 재시도 불가 오류는 즉시, 소진 시 마지막 오류를 그대로 전파
    template<typename Fn>
    auto run(const RetryPolicy& policy, const std::string& operation, Fn&& fn) const -> decltype(fn()) {
        int attempt = 1;
        while (true) {
            try {
                return fn();
            } catch (const TradingError& e) {
                if (!policy.shouldRetry(e, attempt)) {
                    if (attempt > 1) {
                        LOG_WARN("{} failed after {} attempt(s): {}", operation, attempt, e.what());
                    }
                    throw;
                }
                const auto wait = policy.backoffFor(attempt);
                LOG_WARN("{} attempt {}/{} failed: {} (retry in {}ms)",
                         operation, attempt, policy.max_attempts, e.what(), wait.count());
                sleeper_(wait);
                if (RetryInterrupt::requested()) {
                    LOG_WARN("{} retry abandoned: stop requested", operation);
                    throw;
                }
                ++attempt;
            }
        }
    }

private:
    Sleeper sleeper_;
};

} // namespace execution
} // namespace spotpilot
