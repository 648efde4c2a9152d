#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace spotpilot {
namespace execution {

// Rate Limit 그룹별 설정
struct RateLimitConfig {
    std::string group_name;
    int max_per_second;           // 초당 최대 요청 수
    int current_count;            // 현재 초의 요청 수
    std::chrono::steady_clock::time_point window_start;

    RateLimitConfig(const std::string& name, int max_req)
        : group_name(name)
        , max_per_second(max_req)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// Rate Limiter - 엔드포인트 그룹별 초당 요청 제한 (Thread-Safe)
class RateLimiter {
public:
    explicit RateLimiter(std::chrono::milliseconds too_many_requests_pause = std::chrono::seconds(1),
                         std::chrono::milliseconds forbidden_pause = std::chrono::seconds(60));

    // 요청 전 호출 - 가능하면 true, 대기 필요하면 false (Non-blocking)
    bool tryAcquire(const std::string& group);

    // 요청 전 호출 - 필요시 자동으로 대기 (Blocking)
    void acquire(const std::string& group);

    int getRemainingRequests(const std::string& group);

    // X-Bapi-Limit-Status 헤더 (그룹의 남은 요청 수) 반영
    void updateFromHeader(const std::string& group, const std::string& limit_status_header);

    // 429 / 403 응답 시 전체 요청 일시정지
    void handleRateLimitError(int status_code);

    bool isBlocked() const;

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    std::map<std::string, RateLimitConfig> configs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;

    std::chrono::milliseconds too_many_requests_pause_;
    std::chrono::milliseconds forbidden_pause_;
    bool is_blocked_;
    std::chrono::steady_clock::time_point block_end_time_;

    RateLimitConfig& configFor(const std::string& group);
    void resetWindowIfNeeded(RateLimitConfig& config);
};

} // namespace execution
} // namespace spotpilot
