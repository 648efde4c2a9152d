#include "execution/RateLimiter.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "execution/RetryPolicy.h"
#include <algorithm>

namespace spotpilot {
namespace execution {

RateLimiter::RateLimiter(std::chrono::milliseconds too_many_requests_pause,
                         std::chrono::milliseconds forbidden_pause)
    : total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
    , too_many_requests_pause_(too_many_requests_pause)
    , forbidden_pause_(forbidden_pause)
    , is_blocked_(false)
{
    // Bybit v5 기본 한도보다 보수적으로 설정
    configs_.emplace("market", RateLimitConfig("market", 20));    // 시세/캔들/종목정보 (IP당)
    configs_.emplace("account", RateLimitConfig("account", 10));  // 잔고 조회 (UID당)
    configs_.emplace("order", RateLimitConfig("order", 10));      // 주문 생성/취소/조회
    configs_.emplace("default", RateLimitConfig("default", 10));
}

RateLimitConfig& RateLimiter::configFor(const std::string& group) {
    auto it = configs_.find(group);
    if (it == configs_.end()) it = configs_.find("default");
    return it->second;
}

bool RateLimiter::tryAcquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (is_blocked_) {
        if (std::chrono::steady_clock::now() < block_end_time_) {
            rejected_requests_++;
            return false;
        }
        is_blocked_ = false;
        LOG_INFO("API pause lifted (tryAcquire)");
        cv_.notify_all();
    }

    auto& config = configFor(group);
    resetWindowIfNeeded(config);

    if (config.current_count < config.max_per_second) {
        config.current_count++;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);

    while (true) {
        // 1. 일시정지 상태면 풀릴 때까지 대기
        //    (403 일시정지는 길어서 중단 신호를 100ms 단위로 확인)
        if (is_blocked_) {
            if (RetryInterrupt::requested()) {
                throw TransientNetworkError("rate limit pause interrupted by stop request", false);
            }
            const auto slice_end = std::min(block_end_time_,
                std::chrono::steady_clock::now() + std::chrono::milliseconds(100));
            cv_.wait_until(lock, slice_end);
            if (std::chrono::steady_clock::now() >= block_end_time_) {
                is_blocked_ = false;
            } else {
                continue;
            }
        }

        // 2. 윈도우 리셋 및 토큰 체크
        resetWindowIfNeeded(config);

        if (config.current_count < config.max_per_second) {
            config.current_count++;
            total_requests_++;
            return;
        }

        // 3. 다음 윈도우 시작까지 대기
        auto wake_time = config.window_start + std::chrono::seconds(1) + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();
        cv_.wait_until(lock, wake_time);
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start
        );
    }
}

int RateLimiter::getRemainingRequests(const std::string& group) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto& config = configFor(group);
    resetWindowIfNeeded(config);
    return std::max(0, config.max_per_second - config.current_count);
}

void RateLimiter::updateFromHeader(const std::string& group, const std::string& limit_status_header) {
    int remaining = -1;
    try {
        remaining = std::stoi(limit_status_header);
    } catch (const std::exception&) {
        return;
    }
    if (remaining < 0) {
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    auto it = configs_.find(group);
    if (it == configs_.end()) {
        return;
    }
    // 거래소가 알려준 잔여량이 0 이면 현재 윈도우를 소진한 것으로 간주 (보수적 접근)
    if (remaining == 0) {
        it->second.current_count = it->second.max_per_second;
    }
}

void RateLimiter::handleRateLimitError(int status_code) {
    std::unique_lock<std::mutex> lock(mutex_);

    std::chrono::milliseconds pause(0);
    if (status_code == 429) {
        pause = too_many_requests_pause_;
        LOG_WARN("HTTP 429 Too Many Requests - pausing all requests for {}ms", pause.count());
    } else if (status_code == 403) {
        pause = forbidden_pause_;
        LOG_ERROR("HTTP 403 Forbidden (IP rate limit) - pausing all requests for {}ms", pause.count());
    } else {
        return;
    }

    forced_waits_++;
    const auto until = std::chrono::steady_clock::now() + pause;
    if (!is_blocked_ || until > block_end_time_) {
        block_end_time_ = until;
    }
    is_blocked_ = true;
    cv_.notify_all();
}

bool RateLimiter::isBlocked() const {
    std::unique_lock<std::mutex> lock(mutex_);
    return is_blocked_ && std::chrono::steady_clock::now() < block_end_time_;
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;
    return stats;
}

void RateLimiter::resetWindowIfNeeded(RateLimitConfig& config) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - config.window_start
    );

    if (elapsed.count() >= 1000) {
        config.current_count = 0;
        config.window_start = now;
        cv_.notify_all();
    }
}

} // namespace execution
} // namespace spotpilot
