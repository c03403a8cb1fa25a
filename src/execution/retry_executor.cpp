#include "execution/retry_executor.hpp"
#include <chrono>
#include <thread>

namespace lumen {

RetryExecutor::RetryExecutor(const RetryConfig& config, CircuitBreaker& breaker, Metrics& metrics)
    : config_(config)
    , breaker_(breaker)
    , metrics_(metrics)
    , sleeper_([](int64_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); })
    , clock_([] { return now_ms(); })
{
}

void RetryExecutor::on_failure(const std::string& label, int attempt, bool retryable, const char* what) {
    breaker_.record_failure(clock_());
    metrics_.increment("retry.attempt");
    spdlog::warn("{} attempt {}/{} failed (retryable={}): {}",
                 label, attempt, config_.max_attempts, retryable, what);
}

void RetryExecutor::backoff(int attempt) {
    int64_t delay = config_.base_delay_ms * attempt;
    if (delay > 0) {
        sleeper_(delay);
    }
}

} // namespace lumen
