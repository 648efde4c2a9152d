#include "execution/RetryPolicy.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <vector>

using namespace spotpilot;
using execution::RetryExecutor;
using execution::RetryPolicy;

int main() {
    // 백오프: 800 -> 1600 -> 3200 -> 6000(상한)
    {
        const auto policy = RetryPolicy::standard();
        assert(policy.max_attempts == 3);
        assert(policy.backoffFor(1).count() == 800);
        assert(policy.backoffFor(2).count() == 1600);
        assert(policy.backoffFor(3).count() == 3200);
        assert(policy.backoffFor(4).count() == 6000);
        assert(policy.backoffFor(10).count() == 6000);
    }

    // 분류
    {
        const TransientNetworkError before_send("connect refused", false);
        const TransientNetworkError after_send("timeout", true);
        const ExchangeRejected rejected(170131, "Insufficient balance");

        assert(RetryPolicy::isTransient(before_send));
        assert(RetryPolicy::isTransient(after_send));
        assert(!RetryPolicy::isTransient(rejected));
        assert(RetryPolicy::isPreSubmission(before_send));
        assert(!RetryPolicy::isPreSubmission(after_send));

        const auto write = RetryPolicy::preSubmissionOnly();
        assert(write.shouldRetry(before_send, 1));
        assert(!write.shouldRetry(after_send, 1));
        assert(!write.shouldRetry(before_send, 3));
        assert(!RetryPolicy::noRetry().shouldRetry(before_send, 1));
    }

    // 일시적 실패 2번 후 성공: 대기 800, 1600
    {
        std::vector<long long> waits;
        RetryExecutor executor([&waits](std::chrono::milliseconds d) { waits.push_back(d.count()); });
        int calls = 0;
        const int value = executor.run(RetryPolicy::standard(), "read", [&calls]() {
            ++calls;
            if (calls < 3) {
                throw TransientNetworkError("HTTP 503", true, 503);
            }
            return 42;
        });
        assert(value == 42);
        assert(calls == 3);
        assert(waits.size() == 2);
        assert(waits[0] == 800 && waits[1] == 1600);
    }

    // 소진 시 마지막 오류 전파
    {
        int calls = 0;
        RetryExecutor executor([](std::chrono::milliseconds) {});
        bool thrown = false;
        try {
            executor.run(RetryPolicy::standard(), "read", [&calls]() -> int {
                ++calls;
                throw TransientNetworkError("timeout #" + std::to_string(calls), true);
            });
        } catch (const TransientNetworkError& e) {
            thrown = true;
            assert(std::string(e.what()) == "timeout #3");
        }
        assert(thrown);
        assert(calls == 3);
    }

    // 재시도 불가 오류는 1회만
    {
        int calls = 0;
        RetryExecutor executor([](std::chrono::milliseconds) { assert(false && "must not sleep"); });
        bool thrown = false;
        try {
            executor.run(RetryPolicy::standard(), "place", [&calls]() -> int {
                ++calls;
                throw ExchangeRejected(10001, "params error");
            });
        } catch (const ExchangeRejected& e) {
            thrown = true;
            assert(e.code() == 10001);
        }
        assert(thrown);
        assert(calls == 1);
    }

    // 전송 후 타임아웃은 주문 정책에서 재시도하지 않음
    {
        int calls = 0;
        RetryExecutor executor([](std::chrono::milliseconds) {});
        bool thrown = false;
        try {
            executor.run(RetryPolicy::preSubmissionOnly(), "placeOrder", [&calls]() -> int {
                ++calls;
                throw TransientNetworkError("operation timed out", true);
            });
        } catch (const TransientNetworkError&) {
            thrown = true;
        }
        assert(thrown);
        assert(calls == 1);
    }

    // 중단 신호가 설치되면 기본 대기는 신호로 끝나고 마지막 오류를 전파
    {
        using execution::RetryInterrupt;
        assert(!RetryInterrupt::requested());

        int calls = 0;
        std::vector<long long> waits;
        {
            // stop 이 이미 요청된 상태
            RetryInterrupt::Scope scope([&waits](std::chrono::milliseconds d) {
                waits.push_back(d.count());
                return true;
            });

            const auto started = std::chrono::steady_clock::now();
            bool thrown = false;
            try {
                RetryExecutor().run(RetryPolicy::standard(), "getTicker", [&calls]() -> int {
                    ++calls;
                    throw TransientNetworkError("HTTP 503", true, 503);
                });
            } catch (const TransientNetworkError&) {
                thrown = true;
            }
            const auto took = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            assert(thrown);
            assert(calls == 1);
            assert(took < 400);
            assert(!waits.empty() && waits.front() == 800);
            assert(RetryInterrupt::requested());
        }
        // 범위를 벗어나면 해제
        assert(!RetryInterrupt::requested());
    }

    std::cout << "[TEST] RetryPolicy PASSED\n";
    return 0;
}
