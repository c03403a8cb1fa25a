#include <gtest/gtest.h>
#include "core/circuit_breaker.hpp"
#include "test_helpers.hpp"

using namespace lumen;
using namespace lumen::testing_helpers;

TEST(CircuitBreakerTest, ClosedUntilMaxFailures) {
    CircuitBreaker breaker(3, 5 * MINUTE);
    breaker.record_failure(T0);
    breaker.record_failure(T0);
    EXPECT_FALSE(breaker.is_open(T0));

    breaker.record_failure(T0);
    EXPECT_TRUE(breaker.is_open(T0));
    EXPECT_EQ(breaker.failure_count(), 3);
}

TEST(CircuitBreakerTest, SuccessResetsCount) {
    CircuitBreaker breaker(3, 5 * MINUTE);
    breaker.record_failure(T0);
    breaker.record_failure(T0);
    breaker.record_success();
    EXPECT_EQ(breaker.failure_count(), 0);
    EXPECT_EQ(breaker.last_failure_time(), 0);
}

TEST(CircuitBreakerTest, CoolsDownAfterTimeout) {
    CircuitBreaker breaker(2, 5 * MINUTE);
    breaker.record_failure(T0);
    breaker.record_failure(T0);

    EXPECT_TRUE(breaker.is_open(T0 + 5 * MINUTE));       // Not strictly past the timeout
    EXPECT_FALSE(breaker.is_open(T0 + 5 * MINUTE + 1));
    EXPECT_EQ(breaker.failure_count(), 0);
}

TEST(CircuitBreakerTest, ConfigConstructor) {
    CircuitBreakerConfig config;
    config.max_consecutive_failures = 1;
    CircuitBreaker breaker(config);
    breaker.record_failure(T0);
    EXPECT_TRUE(breaker.is_open(T0));
}
