#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config_manager.hpp"
#include "controller.hpp"
#include "error_handler.hpp"
#include "health.hpp"
#include "system_metrics.hpp"
#include "types.hpp"

struct PerformanceSummary {
  bool has_data{false};
  int optimization_level{0};
  OptimizationSettings settings{};
  double avg_cpu_percent{0.0};
  double avg_memory_percent{0.0};
  double avg_fps{0.0};
  double avg_processing_time_ms{0.0};
  std::optional<PerformanceMetrics> latest;
  uint64_t total_frames_processed{0};
  size_t metrics_count{0};
};

// Watches system load on its own thread and trades detection quality for CPU
// and memory headroom across three levels. The pipeline calls
// optimize_frame_processing() on every frame. Above level 0 the level's fps and
// cpu limits are kept in the live config even across reloads.
class PerformanceOptimizer : public HealthCheckable {
public:
  using PerformanceCallback = std::function<void(const PerformanceMetrics&)>;
  using LevelListener =
      std::function<void(int level, const OptimizationSettings&, const DetectionParameters&)>;
  using ReclaimHook = std::function<void()>;

  static constexpr size_t kHistoryCapacity = 100;
  static constexpr size_t kSummaryWindow = 20;
  static constexpr std::chrono::milliseconds kErrorBackoff{5000};

  PerformanceOptimizer(ErrorHandler& errors, ConfigManager& config,
                       SystemMetricsProvider& system,
                       std::chrono::milliseconds interval = std::chrono::milliseconds(3000));
  ~PerformanceOptimizer();

  PerformanceOptimizer(const PerformanceOptimizer&) = delete;
  PerformanceOptimizer& operator=(const PerformanceOptimizer&) = delete;

  void start_monitoring();
  void stop_monitoring();
  bool monitoring() const { return monitoring_.load(); }

  // One monitoring step on a given sample: record it, pick the level, apply it.
  LevelDecision evaluate(const PerformanceMetrics& sample);

  // Returns nothing when the frame should be skipped at the current level.
  std::optional<cv::Mat> optimize_frame_processing(const cv::Mat& frame, uint64_t frame_number);

  // Fills the pipeline fields of the newest sample only.
  void update_pipeline_metrics(double fps, double processing_time_ms, double detection_time_ms,
                               uint64_t total_detections, uint64_t error_count);

  int level() const;
  OptimizationSettings current_settings() const;
  DetectionParameters detection_parameters() const;

  static const std::array<OptimizationSettings, 3>& level_table();
  static DetectionParameters detection_parameters_for(int level);

  std::optional<PerformanceMetrics> get_current_metrics() const;
  std::vector<PerformanceMetrics> get_recent_metrics(size_t count = 10) const;
  PerformanceSummary performance_summary() const;
  std::vector<std::string> recommendations() const;

  void add_performance_callback(PerformanceCallback cb);
  void add_level_listener(LevelListener cb);

  // Default hook returns freed heap pages to the OS.
  void set_reclaim_hook(ReclaimHook hook);
  uint64_t reclaim_count() const { return reclaim_count_.load(); }

  std::string name() const override { return "performance_optimizer"; }
  bool is_healthy() const override { return !monitor_failing_.load(); }

private:
  ErrorHandler& errors_;
  ConfigManager& config_;
  SystemMetricsProvider& system_;
  std::chrono::milliseconds interval_;
  LevelController controller_;

  mutable std::mutex mu_;
  int level_{0};
  std::deque<PerformanceMetrics> history_;
  uint64_t frame_count_{0};
  uint64_t last_gc_frame_{0};
  int skip_frame_counter_{0};
  ReclaimHook reclaim_;

  std::mutex cb_mu_;
  std::vector<PerformanceCallback> perf_callbacks_;
  std::vector<LevelListener> level_listeners_;

  size_t config_callback_{0};

  std::atomic<uint64_t> reclaim_count_{0};
  std::atomic<bool> monitor_failing_{false};
  std::atomic<bool> monitoring_{false};
  std::thread monitor_thread_;
  std::mutex wait_mu_;
  std::condition_variable wait_cv_;

  PerformanceMetrics collect_metrics();
  void monitor_loop();
  void sleep_for(std::chrono::milliseconds d);
  void apply_level(int level);
  void write_level_config(int level);
  void reassert_level(const AppConfig& c);
};
