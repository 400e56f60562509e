#include <gtest/gtest.h>
#include <deque>
#include "controller.hpp"
#include "performance_optimizer.hpp"

class LevelControllerTest : public ::testing::Test {
protected:
    LevelControllerTest() : ctl(PerformanceOptimizer::level_table()) {}

    static PerformanceMetrics sample(double cpu, double mem) {
        PerformanceMetrics m;
        m.cpu_percent = cpu;
        m.memory_percent = mem;
        return m;
    }

    LevelDecision push(int level, double cpu, double mem) {
        auto m = sample(cpu, mem);
        history.push_back(m);
        return ctl.decide(level, m, history);
    }

    LevelController ctl;
    std::deque<PerformanceMetrics> history;
};

TEST_F(LevelControllerTest, EscalatesOnHighCpu) {
    auto d = push(0, 95.0, 30.0);
    EXPECT_EQ(d.level, 1);
    EXPECT_EQ(d.reason, "cpu or memory above level threshold");
}

TEST_F(LevelControllerTest, EscalatesOnHighMemory) {
    auto d = push(0, 10.0, 71.0);
    EXPECT_EQ(d.level, 1);
}

TEST_F(LevelControllerTest, ThresholdItselfDoesNotEscalate) {
    // level 0 allows 50% cpu
    auto d = push(0, 50.0, 30.0);
    EXPECT_EQ(d.level, 0);
}

TEST_F(LevelControllerTest, MovesOneLevelPerCall) {
    auto d = push(0, 99.0, 99.0);
    EXPECT_EQ(d.level, 1);
    d = push(d.level, 99.0, 99.0);
    EXPECT_EQ(d.level, 2);
}

TEST_F(LevelControllerTest, StaysAtMostAggressiveLevel) {
    auto d = push(2, 99.0, 99.0);
    EXPECT_EQ(d.level, 2);
    EXPECT_EQ(d.reason, "already at most aggressive level");
}

TEST_F(LevelControllerTest, LowLoadAtLevelZeroIsNoChange) {
    auto d = push(0, 5.0, 5.0);
    EXPECT_EQ(d.level, 0);
    EXPECT_EQ(d.reason, "no-change");
}

TEST_F(LevelControllerTest, RelaxingNeedsFiveSamples) {
    for (int i = 0; i < 4; ++i) {
        auto d = push(1, 20.0, 20.0);
        EXPECT_EQ(d.level, 1);
        EXPECT_EQ(d.reason, "not enough samples to relax");
    }
    auto d = push(1, 20.0, 20.0);
    EXPECT_EQ(d.level, 0);
    EXPECT_EQ(d.reason, "sustained low cpu and memory");
}

TEST_F(LevelControllerTest, RelaxingNeedsLowRecentAverage) {
    // Level 1 caps: cpu 60, mem 75. Newest sample is under 70% of them,
    // but the last five average above 60% of the cpu cap.
    for (int i = 0; i < 4; ++i) history.push_back(sample(55.0, 20.0));
    auto d = push(1, 20.0, 20.0);
    EXPECT_EQ(d.level, 1);
    EXPECT_EQ(d.reason, "recent average still high");
}

TEST_F(LevelControllerTest, OnlyLastFiveSamplesCount) {
    for (int i = 0; i < 10; ++i) history.push_back(sample(59.0, 70.0));
    for (int i = 0; i < 4; ++i) history.push_back(sample(10.0, 10.0));
    auto d = push(1, 10.0, 10.0);
    EXPECT_EQ(d.level, 0);
}

TEST_F(LevelControllerTest, BetweenRecoverAndLimitHolds) {
    // 70% of 60 is 42; 50 sits between that and the cap.
    for (int i = 0; i < 5; ++i) history.push_back(sample(10.0, 10.0));
    auto d = push(1, 50.0, 10.0);
    EXPECT_EQ(d.level, 1);
    EXPECT_EQ(d.reason, "no-change");
}

TEST_F(LevelControllerTest, OutOfRangeLevelIsClamped) {
    auto d = push(7, 99.0, 99.0);
    EXPECT_EQ(d.level, 2);
    d = push(-3, 5.0, 5.0);
    EXPECT_EQ(d.level, 0);
}
