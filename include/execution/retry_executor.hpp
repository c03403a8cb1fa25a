#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <spdlog/spdlog.h>
#include "common/errors.hpp"
#include "config/config.hpp"
#include "core/circuit_breaker.hpp"
#include "utils/metrics.hpp"

namespace lumen {

/**
 * Bounded retry with linear backoff (base_delay_ms * attempt) in front of
 * a CircuitBreaker.
 *
 * Only TransientError is retried. Every failed attempt is recorded on the
 * breaker; its failure count is the API-error count fed to the kill switch.
 * The same callable runs on each attempt, so the request (and its
 * client_order_id) is identical across retries.
 */
class RetryExecutor {
public:
    using Sleeper = std::function<void(int64_t ms)>;
    using Clock = std::function<int64_t()>;

    RetryExecutor(const RetryConfig& config, CircuitBreaker& breaker, Metrics& metrics);

    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    template <typename Fn>
    auto execute(Fn&& fn, const std::string& label) -> decltype(fn()) {
        if (breaker_.is_open(clock_())) {
            metrics_.increment("retry.circuit_breaker_open");
            throw CircuitOpenError("Circuit breaker open, refusing " + label);
        }

        for (int attempt = 1; ; ++attempt) {
            try {
                if constexpr (std::is_void_v<decltype(fn())>) {
                    fn();
                    breaker_.record_success();
                    return;
                } else {
                    auto result = fn();
                    breaker_.record_success();
                    return result;
                }
            } catch (const TransientError& e) {
                on_failure(label, attempt, true, e.what());
                if (attempt >= config_.max_attempts) {
                    metrics_.increment("retry.exhausted");
                    spdlog::error("{} failed after {} attempts: {}", label, attempt, e.what());
                    throw;
                }
                backoff(attempt);
            } catch (const std::exception& e) {
                on_failure(label, attempt, false, e.what());
                metrics_.increment("retry.fatal_error");
                throw;
            }
        }
    }

    // Consecutive failed attempts since the last success
    int api_error_count() const { return breaker_.failure_count(); }

    const RetryConfig& config() const { return config_; }

private:
    RetryConfig config_;
    CircuitBreaker& breaker_;
    Metrics& metrics_;
    Sleeper sleeper_;
    Clock clock_;

    void on_failure(const std::string& label, int attempt, bool retryable, const char* what);
    void backoff(int attempt);
};

} // namespace lumen
