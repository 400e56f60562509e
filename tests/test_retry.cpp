#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>
#include "retry.hpp"

class RetryTest : public ::testing::Test {
protected:
    SleepFn recorder() {
        return [this](std::chrono::duration<double> d) { sleeps.push_back(d.count()); };
    }

    std::vector<double> sleeps;
};

TEST_F(RetryTest, ReturnsFirstSuccess) {
    int calls = 0;
    int v = retry_call(RetryPolicy{}, "op", [&] { calls++; return 42; }, recorder());
    EXPECT_EQ(v, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(RetryTest, SucceedsOnThirdAttempt) {
    int calls = 0;
    RetryPolicy p{3, 0.5, 2.0};
    int v = retry_call(p, "flaky", [&] {
        if (++calls < 3) throw std::runtime_error("not yet");
        return calls;
    }, recorder());
    EXPECT_EQ(v, 3);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_DOUBLE_EQ(sleeps[0], 0.5);
    EXPECT_DOUBLE_EQ(sleeps[1], 1.0);
}

TEST_F(RetryTest, RethrowsLastExceptionWhenExhausted) {
    int calls = 0;
    RetryPolicy p{2, 1.0, 1.0};
    EXPECT_THROW(retry_call(p, "always", [&]() -> int {
        calls++;
        throw std::logic_error("nope " + std::to_string(calls));
    }, recorder()), std::logic_error);
    EXPECT_EQ(calls, 2);
    EXPECT_EQ(sleeps.size(), 1u);
}

TEST_F(RetryTest, ZeroAttemptsStillCallsOnce) {
    int calls = 0;
    RetryPolicy p{0, 1.0, 1.0};
    retry_call(p, "once", [&] { calls++; }, recorder());
    EXPECT_EQ(calls, 1);
}

TEST_F(RetryTest, DelayGrowsWithBackoff) {
    RetryPolicy p{5, 1.0, 3.0};
    EXPECT_DOUBLE_EQ(p.delay_for(1), 1.0);
    EXPECT_DOUBLE_EQ(p.delay_for(2), 3.0);
    EXPECT_DOUBLE_EQ(p.delay_for(3), 9.0);
}
