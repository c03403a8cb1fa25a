#include <gtest/gtest.h>
#include "common/errors.hpp"
#include "execution/retry_executor.hpp"
#include "test_helpers.hpp"

using namespace lumen;
using namespace lumen::testing_helpers;

class RetryExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.max_attempts = 3;
        config_.base_delay_ms = 200;
        executor_ = std::make_unique<RetryExecutor>(config_, breaker_, metrics_);
        executor_->set_sleeper([this](int64_t ms) { sleeps_.push_back(ms); });
        executor_->set_clock([] { return T0; });
    }

    RetryConfig config_;
    CircuitBreaker breaker_{5, 5 * MINUTE};
    MetricsRegistry metrics_;
    std::unique_ptr<RetryExecutor> executor_;
    std::vector<int64_t> sleeps_;
};

TEST_F(RetryExecutorTest, SuccessOnFirstAttempt) {
    int calls = 0;
    int result = executor_->execute([&] { calls++; return 42; }, "op");
    EXPECT_EQ(result, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(executor_->api_error_count(), 0);
}

TEST_F(RetryExecutorTest, RetriesTransientWithLinearBackoff) {
    int calls = 0;
    int result = executor_->execute([&] {
        if (++calls < 3) throw TransientError("timeout");
        return 7;
    }, "op");

    EXPECT_EQ(result, 7);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps_, (std::vector<int64_t>{200, 400}));
    EXPECT_EQ(metrics_.counter_value("retry.attempt"), 2);
    // Success clears the breaker
    EXPECT_EQ(executor_->api_error_count(), 0);
}

TEST_F(RetryExecutorTest, ExhaustionRethrowsAndLeavesErrorCount) {
    int calls = 0;
    EXPECT_THROW(executor_->execute([&]() -> int {
        calls++;
        throw TransientError("503");
    }, "op"), TransientError);

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(metrics_.counter_value("retry.exhausted"), 1);
    EXPECT_EQ(executor_->api_error_count(), 3);
}

TEST_F(RetryExecutorTest, NonTransientErrorIsNotRetried) {
    int calls = 0;
    EXPECT_THROW(executor_->execute([&]() -> int {
        calls++;
        throw ValidationError("bad size");
    }, "op"), ValidationError);

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps_.empty());
    EXPECT_EQ(metrics_.counter_value("retry.fatal_error"), 1);
    EXPECT_EQ(executor_->api_error_count(), 1);
}

TEST_F(RetryExecutorTest, OpenBreakerRefusesCall) {
    for (int i = 0; i < 5; i++) breaker_.record_failure(T0);

    int calls = 0;
    EXPECT_THROW(executor_->execute([&] { calls++; return 1; }, "op"), CircuitOpenError);
    EXPECT_EQ(calls, 0);
    EXPECT_EQ(metrics_.counter_value("retry.circuit_breaker_open"), 1);
}

TEST_F(RetryExecutorTest, VoidCallable) {
    int calls = 0;
    executor_->execute([&] { calls++; }, "void op");
    EXPECT_EQ(calls, 1);
}
