#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include "performance_optimizer.hpp"

namespace {
class FakeSystemMetrics : public SystemMetricsProvider {
public:
    SystemSample sample() override {
        if (fail) throw std::runtime_error("proc unavailable");
        calls++;
        return next;
    }

    SystemSample next{};
    std::atomic<int> calls{0};
    std::atomic<bool> fail{false};
};

template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}
}  // namespace

class PerformanceOptimizerTest : public ::testing::Test {
protected:
    PerformanceOptimizerTest()
        : config(AppConfig{}),
          optimizer(errors, config, system, std::chrono::milliseconds(10)) {
        optimizer.set_reclaim_hook([this] { reclaims++; });
    }

    static PerformanceMetrics sample(double cpu, double mem = 20.0) {
        PerformanceMetrics m;
        m.timestamp = WallClock::now();
        m.cpu_percent = cpu;
        m.memory_percent = mem;
        return m;
    }

    void go_to_level(int level) {
        while (optimizer.level() < level) optimizer.evaluate(sample(99.0));
    }

    ErrorHandler errors;
    ConfigManager config;
    FakeSystemMetrics system;
    PerformanceOptimizer optimizer;
    int reclaims{0};
};

TEST_F(PerformanceOptimizerTest, StartsAtLevelZero) {
    EXPECT_EQ(optimizer.level(), 0);
    EXPECT_FALSE(optimizer.get_current_metrics().has_value());
    EXPECT_TRUE(optimizer.is_healthy());
    EXPECT_EQ(optimizer.name(), "performance_optimizer");
}

TEST_F(PerformanceOptimizerTest, LevelTableValues) {
    const auto& t = PerformanceOptimizer::level_table();
    EXPECT_DOUBLE_EQ(t[0].target_fps, 1.0);
    EXPECT_DOUBLE_EQ(t[0].max_cpu_percent, 50.0);
    EXPECT_EQ(t[0].detection_skip_frames, 0);
    EXPECT_DOUBLE_EQ(t[1].frame_downsample_factor, 0.8);
    EXPECT_EQ(t[1].detection_skip_frames, 1);
    EXPECT_EQ(t[1].gc_frequency_frames, 50);
    EXPECT_DOUBLE_EQ(t[2].target_fps, 0.5);
    EXPECT_DOUBLE_EQ(t[2].max_cpu_percent, 70.0);
    EXPECT_DOUBLE_EQ(t[2].frame_downsample_factor, 0.6);
    EXPECT_EQ(t[2].detection_skip_frames, 2);
    EXPECT_EQ(t[2].gc_frequency_frames, 25);
}

TEST_F(PerformanceOptimizerTest, HighCpuEscalatesAndWritesConfig) {
    auto d = optimizer.evaluate(sample(95.0));
    EXPECT_EQ(d.level, 1);
    EXPECT_EQ(optimizer.level(), 1);

    const auto cfg = config.get();
    EXPECT_DOUBLE_EQ(cfg.performance.target_fps, 0.8);
    EXPECT_DOUBLE_EQ(cfg.performance.max_cpu_usage, 60.0);
}

TEST_F(PerformanceOptimizerTest, DeescalatesAfterSustainedLowLoad) {
    go_to_level(1);  // one 99% sample in history
    for (int i = 0; i < 3; ++i) {
        optimizer.evaluate(sample(10.0));
        EXPECT_EQ(optimizer.level(), 1);
    }
    // Five samples now, averaging (99 + 4 * 10) / 5 = 27.8, under 60% of 60.
    optimizer.evaluate(sample(10.0));
    EXPECT_EQ(optimizer.level(), 0);
    EXPECT_DOUBLE_EQ(config.get().performance.target_fps, 1.0);
}

TEST_F(PerformanceOptimizerTest, LevelListenersReceiveSettingsAndParameters) {
    int seen_level = -1;
    OptimizationSettings seen_settings;
    DetectionParameters seen_params;
    optimizer.add_level_listener(
        [&](int level, const OptimizationSettings& s, const DetectionParameters& p) {
            seen_level = level;
            seen_settings = s;
            seen_params = p;
        });

    go_to_level(2);
    EXPECT_EQ(seen_level, 2);
    EXPECT_DOUBLE_EQ(seen_settings.frame_downsample_factor, 0.6);
    EXPECT_DOUBLE_EQ(seen_params.scale_factor, 1.3);
    EXPECT_DOUBLE_EQ(seen_params.roi_shrink, 0.8);
    EXPECT_DOUBLE_EQ(optimizer.detection_parameters().scale_factor, 1.3);
}

TEST_F(PerformanceOptimizerTest, ThrowingListenerDoesNotStopOthers) {
    int calls = 0;
    optimizer.add_level_listener([](int, const OptimizationSettings&, const DetectionParameters&) {
        throw std::runtime_error("listener broke");
    });
    optimizer.add_level_listener(
        [&](int, const OptimizationSettings&, const DetectionParameters&) { calls++; });

    EXPECT_NO_THROW(optimizer.evaluate(sample(99.0)));
    EXPECT_EQ(calls, 1);
}

TEST_F(PerformanceOptimizerTest, PerformanceCallbacksSeeEverySample) {
    int calls = 0;
    optimizer.add_performance_callback([&](const PerformanceMetrics&) { calls++; });
    optimizer.evaluate(sample(10.0));
    optimizer.evaluate(sample(10.0));
    EXPECT_EQ(calls, 2);
}

TEST_F(PerformanceOptimizerTest, LevelZeroProcessesEveryFrame) {
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(0, 0, 0));
    for (uint64_t i = 0; i < 5; ++i) {
        auto out = optimizer.optimize_frame_processing(frame, i);
        ASSERT_TRUE(out.has_value());
        EXPECT_EQ(out->cols, 640);
        EXPECT_EQ(out->rows, 480);
    }
}

TEST_F(PerformanceOptimizerTest, SkipDutyCycleAtLevelOne) {
    go_to_level(1);
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(0, 0, 0));
    std::vector<bool> processed;
    for (uint64_t i = 0; i < 4; ++i)
        processed.push_back(optimizer.optimize_frame_processing(frame, i).has_value());
    EXPECT_EQ(processed, (std::vector<bool>{false, true, false, true}));
}

TEST_F(PerformanceOptimizerTest, SkipDutyCycleAtLevelTwo) {
    go_to_level(2);
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(0, 0, 0));
    std::vector<bool> processed;
    for (uint64_t i = 0; i < 6; ++i)
        processed.push_back(optimizer.optimize_frame_processing(frame, i).has_value());
    EXPECT_EQ(processed, (std::vector<bool>{false, false, true, false, false, true}));
}

TEST_F(PerformanceOptimizerTest, DownsamplesByLevelFactor) {
    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(10, 20, 30));

    go_to_level(1);
    optimizer.optimize_frame_processing(frame, 0);  // skipped
    auto out = optimizer.optimize_frame_processing(frame, 1);
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->cols, 512);
    EXPECT_EQ(out->rows, 384);

    go_to_level(2);
    std::optional<cv::Mat> last;
    for (uint64_t i = 2; i < 8 && !last; ++i) last = optimizer.optimize_frame_processing(frame, i);
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->cols, 384);
    EXPECT_EQ(last->rows, 288);
}

TEST_F(PerformanceOptimizerTest, EmptyFramePassesThrough) {
    cv::Mat empty;
    auto out = optimizer.optimize_frame_processing(empty, 0);
    ASSERT_TRUE(out.has_value());
    EXPECT_TRUE(out->empty());
}

TEST_F(PerformanceOptimizerTest, ReclaimRunsEveryGcFrequencyFrames) {
    cv::Mat frame(48, 64, CV_8UC1, cv::Scalar(0));
    for (uint64_t i = 0; i <= 250; ++i) optimizer.optimize_frame_processing(frame, i);
    // level 0 reclaims every 100 frames: at 100 and 200
    EXPECT_EQ(reclaims, 2);
    EXPECT_EQ(optimizer.reclaim_count(), 2u);
}

TEST_F(PerformanceOptimizerTest, HistoryKeepsNewestHundred) {
    for (int i = 0; i < 150; ++i) optimizer.evaluate(sample(static_cast<double>(i % 10)));
    const auto summary = optimizer.performance_summary();
    EXPECT_EQ(summary.metrics_count, PerformanceOptimizer::kHistoryCapacity);
    EXPECT_EQ(optimizer.get_recent_metrics(500).size(), 100u);
    EXPECT_EQ(optimizer.get_recent_metrics().size(), 10u);
}

TEST_F(PerformanceOptimizerTest, UpdatePipelineMetricsTouchesNewestSampleOnly) {
    optimizer.update_pipeline_metrics(1.0, 10.0, 5.0, 1, 0);  // no samples yet, ignored
    EXPECT_FALSE(optimizer.get_current_metrics().has_value());

    optimizer.evaluate(sample(10.0));
    optimizer.evaluate(sample(11.0));
    optimizer.update_pipeline_metrics(0.9, 120.0, 80.0, 4, 2);

    const auto recent = optimizer.get_recent_metrics(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_DOUBLE_EQ(recent[0].fps, 0.0);
    EXPECT_DOUBLE_EQ(recent[1].fps, 0.9);
    EXPECT_DOUBLE_EQ(recent[1].frame_processing_time_ms, 120.0);
    EXPECT_DOUBLE_EQ(recent[1].detection_time_ms, 80.0);
    EXPECT_EQ(recent[1].total_detections, 4u);
    EXPECT_EQ(recent[1].error_count, 2u);
}

TEST_F(PerformanceOptimizerTest, SummaryAveragesRecentWindow) {
    EXPECT_FALSE(optimizer.performance_summary().has_data);

    for (int i = 0; i < 30; ++i) optimizer.evaluate(sample(i < 10 ? 40.0 : 20.0, 10.0));
    const auto s = optimizer.performance_summary();
    EXPECT_TRUE(s.has_data);
    EXPECT_DOUBLE_EQ(s.avg_cpu_percent, 20.0);
    EXPECT_DOUBLE_EQ(s.avg_memory_percent, 10.0);
    ASSERT_TRUE(s.latest.has_value());
    EXPECT_DOUBLE_EQ(s.latest->cpu_percent, 20.0);
    EXPECT_EQ(s.metrics_count, 30u);
}

TEST_F(PerformanceOptimizerTest, Recommendations) {
    auto r = optimizer.recommendations();
    ASSERT_EQ(r.size(), 1u);
    EXPECT_EQ(r[0], "No performance data available");

    auto hot = sample(85.0, 85.0);
    hot.temperature_celsius = 75.0;
    optimizer.evaluate(hot);
    optimizer.update_pipeline_metrics(0.2, 2500.0, 100.0, 0, 0);
    r = optimizer.recommendations();
    EXPECT_EQ(r.size(), 5u);

    optimizer.evaluate(sample(10.0, 10.0));
    optimizer.update_pipeline_metrics(1.0, 100.0, 50.0, 0, 0);
    r = optimizer.recommendations();
    ASSERT_EQ(r.size(), 1u);
    EXPECT_EQ(r[0], "Performance is within acceptable parameters");
}

TEST_F(PerformanceOptimizerTest, MonitoringThreadSamplesProvider) {
    system.next.cpu_percent = 95.0;
    system.next.memory_percent = 20.0;
    optimizer.start_monitoring();
    EXPECT_TRUE(optimizer.monitoring());
    EXPECT_TRUE(wait_until([&] { return optimizer.level() >= 1; }));
    optimizer.stop_monitoring();
    EXPECT_FALSE(optimizer.monitoring());
    EXPECT_GT(system.calls.load(), 0);
}

TEST_F(PerformanceOptimizerTest, FailedCollectionRecordsZeroSample) {
    system.fail = true;
    optimizer.start_monitoring();
    EXPECT_TRUE(wait_until([&] { return optimizer.get_current_metrics().has_value(); }));
    EXPECT_TRUE(wait_until([&] { return !optimizer.is_healthy(); }));
    optimizer.stop_monitoring();

    auto m = optimizer.get_current_metrics();
    ASSERT_TRUE(m.has_value());
    EXPECT_DOUBLE_EQ(m->cpu_percent, 0.0);
    EXPECT_DOUBLE_EQ(m->memory_percent, 0.0);
    EXPECT_FALSE(m->temperature_celsius.has_value());
    EXPECT_EQ(optimizer.level(), 0);

    auto health = errors.component_health("performance_optimizer");
    ASSERT_TRUE(health.has_value());
    EXPECT_GE(health->error_count, 1);
}

TEST_F(PerformanceOptimizerTest, RecoveredCollectionRestoresHealth) {
    system.fail = true;
    optimizer.start_monitoring();
    EXPECT_TRUE(wait_until([&] { return !optimizer.is_healthy(); }));
    system.fail = false;
    EXPECT_TRUE(wait_until([&] { return optimizer.is_healthy(); }));
    optimizer.stop_monitoring();
    EXPECT_GT(system.calls.load(), 0);
}

TEST_F(PerformanceOptimizerTest, LevelSettingsSurviveConfigReplacement) {
    go_to_level(2);
    ASSERT_DOUBLE_EQ(config.get().performance.target_fps, 0.5);

    AppConfig replacement;
    replacement.notifications.cooldown_minutes = 9;
    EXPECT_TRUE(config.update([&](AppConfig& c) { c = replacement; }));

    const auto c = config.get();
    EXPECT_EQ(c.notifications.cooldown_minutes, 9);
    EXPECT_DOUBLE_EQ(c.performance.target_fps, 0.5);
    EXPECT_DOUBLE_EQ(c.performance.max_cpu_usage, 70.0);
}

TEST_F(PerformanceOptimizerTest, LevelZeroLeavesConfiguredFps) {
    EXPECT_TRUE(config.update([](AppConfig& c) { c.performance.target_fps = 2.0; }));
    EXPECT_DOUBLE_EQ(config.get().performance.target_fps, 2.0);
}

TEST_F(PerformanceOptimizerTest, DestroyedOptimizerStopsListening) {
    ErrorHandler other_errors;
    ConfigManager other_config(AppConfig{});
    {
        PerformanceOptimizer temp(other_errors, other_config, system);
        temp.evaluate(sample(99.0));
        ASSERT_EQ(temp.level(), 1);
    }
    EXPECT_TRUE(other_config.update([](AppConfig& c) { c.performance.target_fps = 3.0; }));
    EXPECT_DOUBLE_EQ(other_config.get().performance.target_fps, 3.0);
}
