#pragma once

#include <cstdint>
#include "common/types.hpp"
#include "config/config.hpp"

namespace lumen {

/**
 * Consecutive-failure breaker for outbound adapter calls.
 *
 * Not persisted; a restart closes it. Once failures stop arriving for
 * longer than reset_timeout_ms the counter clears on the next is_open().
 */
class CircuitBreaker {
public:
    explicit CircuitBreaker(const CircuitBreakerConfig& config = CircuitBreakerConfig{});
    CircuitBreaker(int max_consecutive_failures, int64_t reset_timeout_ms);

    bool is_open(int64_t now = now_ms());

    void record_failure(int64_t now = now_ms());
    void record_success();
    void reset();

    int failure_count() const { return failure_count_; }
    int64_t last_failure_time() const { return last_failure_time_; }
    int max_consecutive_failures() const { return max_consecutive_failures_; }

private:
    int max_consecutive_failures_;
    int64_t reset_timeout_ms_;

    int failure_count_{0};
    int64_t last_failure_time_{0};
};

} // namespace lumen
