#include "execution/RetryPolicy.h"

#include <algorithm>
#include <cmath>
#include <thread>
#include <utility>

namespace spotpilot {
namespace execution {

namespace {
thread_local RetryInterrupt::Waiter t_interrupt;
}

RetryInterrupt::Scope::Scope(Waiter waiter)
    : previous_(std::move(t_interrupt)) {
    t_interrupt = std::move(waiter);
}

RetryInterrupt::Scope::~Scope() {
    t_interrupt = std::move(previous_);
}

bool RetryInterrupt::sleepFor(std::chrono::milliseconds duration) {
    if (t_interrupt) {
        return t_interrupt(duration);
    }
    std::this_thread::sleep_for(duration);
    return false;
}

bool RetryInterrupt::requested() {
    return t_interrupt ? t_interrupt(std::chrono::milliseconds(0)) : false;
}

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const {
    if (attempt < 1) attempt = 1;
    const double scaled = static_cast<double>(initial_backoff.count()) *
                          std::pow(backoff_multiplier, attempt - 1);
    const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<long long>(capped));
}

bool RetryPolicy::shouldRetry(const TradingError& error, int attempt) const {
    if (attempt >= max_attempts) {
        return false;
    }
    return is_retryable ? is_retryable(error) : false;
}

bool RetryPolicy::isTransient(const TradingError& error) {
    return error.kind() == ErrorKind::TRANSIENT_NETWORK;
}

bool RetryPolicy::isPreSubmission(const TradingError& error) {
    if (error.kind() != ErrorKind::TRANSIENT_NETWORK) {
        return false;
    }
    const auto& net = static_cast<const TransientNetworkError&>(error);
    return !net.requestSent();
}

RetryPolicy RetryPolicy::standard() {
    RetryPolicy policy;
    policy.is_retryable = &RetryPolicy::isTransient;
    return policy;
}

RetryPolicy RetryPolicy::preSubmissionOnly() {
    RetryPolicy policy;
    policy.is_retryable = &RetryPolicy::isPreSubmission;
    return policy;
}

RetryPolicy RetryPolicy::noRetry() {
    RetryPolicy policy;
    policy.max_attempts = 1;
    return policy;
}

} // namespace execution
} // namespace spotpilot
