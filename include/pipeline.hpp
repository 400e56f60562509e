#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <functional>
#include <mutex>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "cat_detector.hpp"
#include "config_manager.hpp"
#include "detection_validator.hpp"
#include "error_handler.hpp"
#include "frame_source.hpp"
#include "health.hpp"
#include "metrics.hpp"
#include "notifier.hpp"
#include "output_manager.hpp"
#include "performance_optimizer.hpp"
#include "types.hpp"

struct PipelineStatus {
  bool running{false};
  bool healthy{true};
  bool monitoring_active{true};
  uint64_t frames_processed{0};
  double fps{0.0};
  uint64_t detections{0};
  uint64_t errors{0};
  int consecutive_errors{0};
  std::optional<WallTime> last_detection;
  int optimization_level{0};
};

// Outcome of one tick, mostly for tests and logging.
struct FrameResult {
  bool skipped{false};
  size_t raw_detections{0};
  std::vector<ValidDetection> valid;
  int cat_count{0};
  std::vector<std::string> image_paths;
};

class Pipeline : public HealthCheckable {
public:
  using LocalTimeFn = std::function<std::tm()>;

  static constexpr int kMaxConsecutiveErrors = 10;
  static constexpr int kFpsWindowFrames = 10;
  static constexpr std::chrono::milliseconds kErrorPause{1000};
  static constexpr std::chrono::seconds kIdlePoll{60};
  static constexpr std::chrono::hours kCleanupInterval{1};

  // All collaborators must outlive the pipeline, and the optimizer's monitor must be
  // stopped before the pipeline is destroyed (it holds a level listener into us).
  Pipeline(ConfigManager& config, ErrorHandler& errors, MetricsRegistry& metrics,
           PerformanceOptimizer& optimizer, FrameSource& source, CatDetector& detector,
           OutputManager& output, Notifier& notifier);
  ~Pipeline();

  bool open();   // Open input, load detector, prepare storage
  void start();  // Start processing loop in a background thread
  void stop();   // Stop and join thread
  bool running() const { return running_.load(); }

  // One full tick on a given frame: optimize, detect, validate, count, store, notify.
  FrameResult process_frame(const cv::Mat& frame);

  // Validated and committed through the config manager; picked up on the next tick.
  bool update_configuration(const AppConfig& cfg);

  // Sends a synthetic 0.9-confidence detection through storage and notification.
  ValidDetection trigger_test_detection();

  PipelineStatus status() const;
  StatSnapshot stats() const;
  ValidationStats validation_stats() const;

  void set_local_time_fn(LocalTimeFn fn) { local_time_ = std::move(fn); }

  std::string name() const override { return "pipeline"; }
  bool is_healthy() const override { return consecutive_errors_.load() < kMaxConsecutiveErrors; }

private:
  ConfigManager& config_;
  ErrorHandler& errors_;
  MetricsRegistry& metrics_;
  PerformanceOptimizer& optimizer_;
  FrameSource& source_;
  CatDetector& detector_;
  OutputManager& output_;
  Notifier& notifier_;

  // Pipeline-thread state.
  DetectionValidator validator_;
  AppConfig cfg_;
  uint64_t seen_generation_{0};
  uint64_t frame_number_{0};
  int fps_window_frames_{0};
  TimePoint fps_window_start_{};
  LocalTimeFn local_time_;

  mutable std::mutex stat_mu_;
  double fps_{0.0};
  std::optional<WallTime> last_detection_;
  ValidationStats validation_stats_{};
  bool monitoring_active_{true};

  std::atomic<uint64_t> frames_processed_{0};
  std::atomic<uint64_t> detections_{0};
  std::atomic<uint64_t> error_count_{0};
  std::atomic<int> consecutive_errors_{0};

  std::mutex lifecycle_mu_;  // serializes start() and stop()
  std::atomic<bool> running_{false};
  std::thread loop_thread_;
  std::mutex wait_mu_;
  std::condition_variable wait_cv_;

  void run();
  void sync_config();
  void record_error(const std::exception& e, const std::string& context);
  void sleep_for(std::chrono::milliseconds d);
  void update_fps();
};
