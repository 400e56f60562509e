#include <gtest/gtest.h>
#include <stdexcept>
#include "error_handler.hpp"

class ErrorHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        handler.register_component("camera");
        handler.register_component("detector", 2);
    }

    ErrorHandler handler;
};

TEST_F(ErrorHandlerTest, RegisteredComponentsStartHealthy) {
    auto h = handler.component_health("camera");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->status, ComponentStatus::HEALTHY);
    EXPECT_EQ(h->error_count, 0);
    EXPECT_EQ(h->max_recovery_attempts, 3);
    EXPECT_FALSE(handler.component_health("unknown").has_value());
}

TEST_F(ErrorHandlerTest, SeverityDrivesComponentStatus) {
    handler.handle_error("camera", "ReadError", "frame grab failed", ErrorSeverity::LOW);
    EXPECT_EQ(handler.component_health("camera")->status, ComponentStatus::DEGRADED);

    handler.handle_error("camera", "DeviceLost", "device vanished", ErrorSeverity::CRITICAL);
    EXPECT_EQ(handler.component_health("camera")->status, ComponentStatus::FAILED);

    handler.handle_error("detector", "Slow", "inference slow", ErrorSeverity::HIGH);
    EXPECT_EQ(handler.component_health("detector")->status, ComponentStatus::DEGRADED);
}

TEST_F(ErrorHandlerTest, UnknownComponentIsCreatedOnFirstError) {
    handler.handle_error("notifier", "Timeout", "push timed out");
    auto h = handler.component_health("notifier");
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ(h->error_count, 1);
    ASSERT_TRUE(h->last_error.has_value());
    EXPECT_EQ(h->last_error->error_type, "Timeout");
}

TEST_F(ErrorHandlerTest, ExceptionTypeBecomesErrorType) {
    handler.handle_error("camera", std::runtime_error("boom"));
    auto recent = handler.recent_errors(1);
    ASSERT_EQ(recent.size(), 1u);
    EXPECT_EQ(recent[0].error_type, "std::runtime_error");
    EXPECT_EQ(recent[0].message, "boom");
}

TEST_F(ErrorHandlerTest, RepeatedErrorsAreMerged) {
    for (int i = 0; i < 4; ++i) handler.handle_error("camera", "ReadError", "frame grab failed");
    handler.handle_error("camera", "ReadError", "different message");

    auto recent = handler.recent_errors(10);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].occurrence_count, 4);
    EXPECT_EQ(recent[1].occurrence_count, 1);

    auto stats = handler.error_statistics();
    EXPECT_EQ(stats.total_errors, 5u);
    EXPECT_EQ(stats.errors_last_hour, 5u);
    EXPECT_EQ(stats.by_severity[ErrorSeverity::MEDIUM], 5u);
}

TEST_F(ErrorHandlerTest, HistoryIsBounded) {
    ErrorHandler small(3);
    for (int i = 0; i < 10; ++i)
        small.handle_error("camera", "ReadError", "failure " + std::to_string(i));
    auto recent = small.recent_errors(100);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent.back().message, "failure 9");
}

TEST_F(ErrorHandlerTest, TopPatternsAreSortedAndCapped) {
    const char* types[] = {"A", "B", "C", "D", "E", "F"};
    for (int i = 0; i < 6; ++i) {
        for (int n = 0; n <= i; ++n) handler.handle_error("camera", types[i], "msg");
    }
    auto stats = handler.error_statistics();
    ASSERT_EQ(stats.top_patterns.size(), 5u);
    EXPECT_EQ(stats.top_patterns[0].first, "camera:F");
    EXPECT_EQ(stats.top_patterns[0].second, 6);
    EXPECT_EQ(stats.top_patterns[4].first, "camera:B");
}

TEST_F(ErrorHandlerTest, SuccessfulRecoveryRestoresHealth) {
    int calls = 0;
    handler.register_recovery_strategy("ReadError", [&](const ErrorRecord& rec) {
        calls++;
        EXPECT_EQ(rec.component, "camera");
        return true;
    });

    EXPECT_TRUE(handler.handle_error("camera", "ReadError", "frame grab failed"));
    EXPECT_EQ(calls, 1);
    auto h = handler.component_health("camera");
    EXPECT_EQ(h->status, ComponentStatus::HEALTHY);
    EXPECT_EQ(h->recovery_attempts, 0);
    EXPECT_TRUE(h->last_error->recovery_attempted);
    EXPECT_TRUE(h->last_error->recovery_successful);
}

TEST_F(ErrorHandlerTest, FailedRecoveryExhaustsAttempts) {
    handler.register_recovery_strategy("ModelError", [](const ErrorRecord&) { return false; });

    // detector allows two attempts
    EXPECT_FALSE(handler.handle_error("detector", "ModelError", "load failed"));
    EXPECT_EQ(handler.component_health("detector")->status, ComponentStatus::DEGRADED);

    EXPECT_FALSE(handler.handle_error("detector", "ModelError", "load failed"));
    EXPECT_EQ(handler.component_health("detector")->status, ComponentStatus::FAILED);
    EXPECT_EQ(handler.component_health("detector")->recovery_attempts, 2);

    EXPECT_FALSE(handler.handle_error("detector", "ModelError", "load failed"));
    EXPECT_EQ(handler.component_health("detector")->recovery_attempts, 2);
}

TEST_F(ErrorHandlerTest, ThrowingStrategyCountsAsFailure) {
    handler.register_recovery_strategy("ReadError", [](const ErrorRecord&) -> bool {
        throw std::runtime_error("strategy broke");
    });
    EXPECT_FALSE(handler.handle_error("camera", "ReadError", "frame grab failed"));
    EXPECT_EQ(handler.component_health("camera")->status, ComponentStatus::DEGRADED);
}

TEST_F(ErrorHandlerTest, MarkHealthyResetsStatus) {
    handler.handle_error("camera", "ReadError", "x", ErrorSeverity::HIGH);
    handler.mark_component_healthy("camera");
    EXPECT_TRUE(handler.component_health("camera")->is_healthy());
}

TEST_F(ErrorHandlerTest, GracefulDegradationCycle) {
    EXPECT_TRUE(handler.recover_from_degradation());

    int fired = 0;
    handler.register_recovery_callback("camera", [&] { fired++; });
    handler.trigger_graceful_degradation("camera offline");
    EXPECT_TRUE(handler.is_system_degraded());

    EXPECT_TRUE(handler.recover_from_degradation());
    EXPECT_FALSE(handler.is_system_degraded());
    EXPECT_EQ(fired, 1);
}

TEST_F(ErrorHandlerTest, FailedComponentBlocksRecovery) {
    handler.trigger_graceful_degradation("overload");
    handler.handle_error("camera", "DeviceLost", "gone", ErrorSeverity::CRITICAL);
    EXPECT_FALSE(handler.recover_from_degradation());
    EXPECT_TRUE(handler.is_system_degraded());
}

TEST_F(ErrorHandlerTest, EnumNames) {
    EXPECT_STREQ(to_string(ErrorSeverity::CRITICAL), "critical");
    EXPECT_STREQ(to_string(ComponentStatus::RECOVERING), "recovering");
}
