#include "core/circuit_breaker.hpp"
#include <spdlog/spdlog.h>

namespace lumen {

CircuitBreaker::CircuitBreaker(const CircuitBreakerConfig& config)
    : CircuitBreaker(config.max_consecutive_failures, config.reset_timeout_ms)
{
}

CircuitBreaker::CircuitBreaker(int max_consecutive_failures, int64_t reset_timeout_ms)
    : max_consecutive_failures_(max_consecutive_failures)
    , reset_timeout_ms_(reset_timeout_ms)
{
}

bool CircuitBreaker::is_open(int64_t now) {
    if (failure_count_ > 0 && now - last_failure_time_ > reset_timeout_ms_) {
        spdlog::info("Circuit breaker cooled down after {}ms, clearing {} failures",
                     now - last_failure_time_, failure_count_);
        reset();
    }
    return failure_count_ >= max_consecutive_failures_;
}

void CircuitBreaker::record_failure(int64_t now) {
    failure_count_++;
    last_failure_time_ = now;

    if (failure_count_ == max_consecutive_failures_) {
        spdlog::error("Circuit breaker OPEN after {} consecutive failures", failure_count_);
    }
}

void CircuitBreaker::record_success() {
    reset();
}

void CircuitBreaker::reset() {
    failure_count_ = 0;
    last_failure_time_ = 0;
}

} // namespace lumen
