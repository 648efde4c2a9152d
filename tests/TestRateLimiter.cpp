#include "execution/RateLimiter.h"
#include "execution/RetryPolicy.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

using spotpilot::execution::RateLimiter;

int main() {
    using Ms = std::chrono::milliseconds;

    // 그룹별 초당 한도
    {
        RateLimiter limiter(Ms(50), Ms(100));
        assert(limiter.getRemainingRequests("market") == 20);
        assert(limiter.getRemainingRequests("order") == 10);
        assert(limiter.getRemainingRequests("unknown") == 10);

        for (int i = 0; i < 20; ++i) {
            assert(limiter.tryAcquire("market"));
        }
        assert(!limiter.tryAcquire("market"));
        assert(limiter.tryAcquire("order"));   // 다른 그룹은 영향 없음

        const auto stats = limiter.getStats();
        assert(stats.total_requests == 21);
        assert(stats.rejected_requests == 1);
    }

    // X-Bapi-Limit-Status 가 0 이면 현재 윈도우 소진
    {
        RateLimiter limiter;
        limiter.updateFromHeader("order", "0");
        assert(limiter.getRemainingRequests("order") == 0);
        limiter.updateFromHeader("account", "not-a-number");
        limiter.updateFromHeader("account", "3");
        assert(limiter.getRemainingRequests("account") == 10);
    }

    // 429 -> 전체 일시정지, 기간이 지나면 해제
    {
        RateLimiter limiter(Ms(80), Ms(200));
        limiter.handleRateLimitError(500);
        assert(!limiter.isBlocked());

        limiter.handleRateLimitError(429);
        assert(limiter.isBlocked());
        assert(!limiter.tryAcquire("market"));

        const auto before = std::chrono::steady_clock::now();
        limiter.acquire("market");
        const auto waited = std::chrono::duration_cast<Ms>(std::chrono::steady_clock::now() - before);
        assert(waited.count() >= 60);
        assert(!limiter.isBlocked());
    }

    // 한도 소진 시 acquire 는 다음 윈도우까지 대기
    {
        RateLimiter limiter;
        for (int i = 0; i < 10; ++i) {
            limiter.acquire("account");
        }
        const auto before = std::chrono::steady_clock::now();
        limiter.acquire("account");
        const auto waited = std::chrono::duration_cast<Ms>(std::chrono::steady_clock::now() - before);
        assert(waited.count() >= 500);
        assert(limiter.getStats().forced_waits >= 1);
    }

    // 403 일시정지 중 stop 이 요청되면 acquire 는 오래 기다리지 않고 예외
    {
        RateLimiter limiter(Ms(1000), Ms(5000));
        limiter.handleRateLimitError(403);
        assert(limiter.isBlocked());

        std::atomic<bool> stop{false};
        spotpilot::execution::RetryInterrupt::Scope scope([&stop](Ms duration) {
            if (!stop.load() && duration.count() > 0) {
                std::this_thread::sleep_for(duration);
            }
            return stop.load();
        });
        std::thread stopper([&stop]() {
            std::this_thread::sleep_for(Ms(150));
            stop = true;
        });

        const auto before = std::chrono::steady_clock::now();
        bool thrown = false;
        try {
            limiter.acquire("market");
        } catch (const spotpilot::TransientNetworkError& e) {
            thrown = true;
            assert(!e.requestSent());
        }
        const auto waited = std::chrono::duration_cast<Ms>(std::chrono::steady_clock::now() - before);
        stopper.join();
        assert(thrown);
        assert(waited.count() >= 100);
        assert(waited.count() < 1000);
        assert(limiter.isBlocked());
    }

    std::cout << "[TEST] RateLimiter PASSED\n";
    return 0;
}
