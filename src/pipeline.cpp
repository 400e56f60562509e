#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <stdexcept>

using namespace std::chrono;

namespace {
std::tm local_now() {
  std::time_t tt = WallClock::to_time_t(WallClock::now());
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

int scale_coord(int v, double s) { return static_cast<int>(std::lround(v * s)); }
}  // namespace

Pipeline::Pipeline(ConfigManager& config, ErrorHandler& errors, MetricsRegistry& metrics,
                   PerformanceOptimizer& optimizer, FrameSource& source, CatDetector& detector,
                   OutputManager& output, Notifier& notifier)
    : config_(config),
      errors_(errors),
      metrics_(metrics),
      optimizer_(optimizer),
      source_(source),
      detector_(detector),
      output_(output),
      notifier_(notifier),
      validator_(config.get().detection),
      cfg_(config.get()),
      seen_generation_(config.generation()),
      fps_window_start_(Clock::now()),
      local_time_(local_now) {
  errors_.register_component(name());

  const auto settings = optimizer_.current_settings();
  detector_.apply_parameters(optimizer_.detection_parameters(), settings.enable_roi_optimization);
  detector_.set_roi(cfg_.detection.roi);

  optimizer_.add_level_listener(
      [this](int, const OptimizationSettings& s, const DetectionParameters& p) {
        detector_.apply_parameters(p, s.enable_roi_optimization);
      });
}

Pipeline::~Pipeline() { stop(); }

bool Pipeline::open() {
  if (!source_.open()) {
    spdlog::error("Failed to open input. Detection will not run.");
    return false;
  }
  if (!detector_.initialize()) {
    errors_.handle_error("cat_detector", "DetectorInitFailed", "cascade could not be loaded",
                         ErrorSeverity::CRITICAL);
    return false;
  }
  if (!output_.initialize()) {
    errors_.handle_error("output_manager", "StorageInitFailed", "output directory not writable",
                         ErrorSeverity::HIGH);
    return false;
  }
  return true;
}

void Pipeline::start() {
  std::lock_guard<std::mutex> life(lifecycle_mu_);
  if (running_.exchange(true)) return;
  fps_window_start_ = Clock::now();
  loop_thread_ = std::thread([this] { run(); });
  spdlog::info("Detection pipeline started");
}

void Pipeline::stop() {
  std::lock_guard<std::mutex> life(lifecycle_mu_);
  {
    std::lock_guard<std::mutex> lk(wait_mu_);
    if (!running_.exchange(false)) return;
  }
  wait_cv_.notify_all();
  if (loop_thread_.joinable()) loop_thread_.join();
  spdlog::info("Detection pipeline stopped after {} frames", frames_processed_.load());
}

void Pipeline::sleep_for(milliseconds d) {
  std::unique_lock<std::mutex> lk(wait_mu_);
  wait_cv_.wait_for(lk, d, [this] { return !running_.load(); });
}

void Pipeline::run() {
  auto last_cleanup = Clock::now();
  double applied_fps = 0.0;

  while (running_) {
    const auto tick_start = Clock::now();
    sync_config();

    const bool active = is_monitoring_active(cfg_.schedule, local_time_());
    {
      std::lock_guard<std::mutex> g(stat_mu_);
      if (active != monitoring_active_)
        spdlog::info("Monitoring schedule: {}", active ? "active" : "paused");
      monitoring_active_ = active;
    }
    if (!active) {
      sleep_for(duration_cast<milliseconds>(kIdlePoll));
      continue;
    }

    const double target_fps = cfg_.performance.target_fps > 0.0 ? cfg_.performance.target_fps : 1.0;
    if (target_fps != applied_fps) {
      source_.set_target_fps(target_fps);
      applied_fps = target_fps;
    }

    try {
      auto frame = source_.grab();
      if (!frame) throw std::runtime_error("no frame from input " + cfg_.input.uri);
      process_frame(*frame);
      consecutive_errors_ = 0;
    } catch (const std::exception& e) {
      record_error(e, "processing loop");
      sleep_for(kErrorPause);
      continue;
    }

    if (Clock::now() - last_cleanup >= kCleanupInterval) {
      output_.cleanup_old_data();
      last_cleanup = Clock::now();
    }
    output_.logPerformanceSummary();

    const double period_ms = 1000.0 / target_fps;
    const double elapsed = duration<double, std::milli>(Clock::now() - tick_start).count();
    const double to_sleep = period_ms - elapsed;
    if (to_sleep > 0) sleep_for(milliseconds(static_cast<int64_t>(to_sleep)));
  }
}

void Pipeline::sync_config() {
  const uint64_t gen = config_.generation();
  if (gen == seen_generation_) return;
  seen_generation_ = gen;
  cfg_ = config_.get();

  validator_.apply(cfg_.detection);
  detector_.set_roi(cfg_.detection.roi);
  notifier_.set_config(cfg_.notifications);
  output_.set_config(cfg_.storage);
  spdlog::info("Pipeline picked up configuration change");
}

FrameResult Pipeline::process_frame(const cv::Mat& frame) {
  sync_config();
  FrameResult result;
  const auto t0 = Clock::now();
  const uint64_t frame_number = ++frame_number_;

  metrics_.inc_frame();
  output_.record_frame();
  frames_processed_.fetch_add(1);

  auto optimized = optimizer_.optimize_frame_processing(frame, frame_number);
  if (!optimized) {
    metrics_.inc_skipped();
    result.skipped = true;
    update_fps();
    return result;
  }

  const auto td = Clock::now();
  std::vector<Detection> raw = detector_.detect(*optimized, frame.size());
  const double detect_ms = duration<double, std::milli>(Clock::now() - td).count();
  metrics_.add_detect_ms(detect_ms);

  // Detector coordinates are in the downsampled frame; the ROI is in full-frame pixels.
  if (!optimized->empty() && (optimized->cols != frame.cols || optimized->rows != frame.rows)) {
    const double sx = static_cast<double>(frame.cols) / optimized->cols;
    const double sy = static_cast<double>(frame.rows) / optimized->rows;
    for (auto& d : raw) {
      for (auto& b : d.bounding_boxes) {
        b.x = scale_coord(b.x, sx);
        b.y = scale_coord(b.y, sy);
        b.width = scale_coord(b.width, sx);
        b.height = scale_coord(b.height, sy);
      }
      d.frame_width = frame.cols;
      d.frame_height = frame.rows;
    }
  }

  result.raw_detections = raw.size();
  metrics_.add_raw_detections(raw.size());

  result.valid = validator_.validate_detections(raw);
  result.cat_count = validator_.count_cats(result.valid);
  metrics_.add_valid_detections(result.valid.size());
  metrics_.add_cats(static_cast<uint64_t>(result.cat_count));

  for (const auto& v : result.valid) {
    const std::string image = output_.save_detection(v, frame);
    result.image_paths.push_back(image);
    if (notifier_.notify(v, image) == NotifyResult::SENT) metrics_.inc_notification();
    detections_.fetch_add(1);
    {
      std::lock_guard<std::mutex> g(stat_mu_);
      last_detection_ = v.timestamp;
    }
    spdlog::info("Processed detection: {} cat(s), confidence: {:.2f}", v.cat_count,
                 v.validated_confidence);
  }

  const double frame_ms = duration<double, std::milli>(Clock::now() - t0).count();
  metrics_.add_frame_ms(frame_ms);
  update_fps();

  double fps = 0.0;
  {
    std::lock_guard<std::mutex> g(stat_mu_);
    fps = fps_;
    validation_stats_ = validator_.stats();
  }
  optimizer_.update_pipeline_metrics(fps, frame_ms, detect_ms, detections_.load(),
                                     error_count_.load());
  return result;
}

void Pipeline::update_fps() {
  if (++fps_window_frames_ < kFpsWindowFrames) return;
  const auto now = Clock::now();
  const double secs = duration<double>(now - fps_window_start_).count();
  {
    std::lock_guard<std::mutex> g(stat_mu_);
    fps_ = secs > 0.0 ? fps_window_frames_ / secs : 0.0;
  }
  fps_window_frames_ = 0;
  fps_window_start_ = now;
}

void Pipeline::record_error(const std::exception& e, const std::string& context) {
  error_count_.fetch_add(1);
  const int consecutive = ++consecutive_errors_;
  metrics_.inc_error();
  const auto severity =
      consecutive >= kMaxConsecutiveErrors ? ErrorSeverity::HIGH : ErrorSeverity::MEDIUM;
  errors_.handle_error(name(), e, severity, context);
  if (consecutive == kMaxConsecutiveErrors)
    spdlog::error("Pipeline unhealthy after {} consecutive errors", consecutive);
}

bool Pipeline::update_configuration(const AppConfig& cfg) {
  return config_.update([&](AppConfig& c) { c = cfg; });
}

ValidDetection Pipeline::trigger_test_detection() {
  const AppConfig cfg = config_.get();
  const Roi& roi = cfg.detection.roi;

  ValidDetection v;
  v.timestamp = WallClock::now();
  v.bounding_boxes.push_back(
      BoundingBox{roi.x + roi.width / 4, roi.y + roi.height / 4, roi.width / 2, roi.height / 2, 0.9f});
  v.frame_width = cfg.input.width;
  v.frame_height = cfg.input.height;
  v.raw_confidence = 0.9f;
  v.cat_count = 1;
  v.is_on_counter = true;
  v.validated_confidence = 0.9f;

  cv::Mat blank = cv::Mat::zeros(cfg.input.height, cfg.input.width, CV_8UC3);
  const std::string image = output_.save_detection(v, blank);
  if (notifier_.notify(v, image) == NotifyResult::SENT) metrics_.inc_notification();
  detections_.fetch_add(1);
  {
    std::lock_guard<std::mutex> g(stat_mu_);
    last_detection_ = v.timestamp;
  }
  spdlog::info("Test detection triggered");
  return v;
}

PipelineStatus Pipeline::status() const {
  PipelineStatus s;
  s.running = running_.load();
  s.healthy = is_healthy();
  s.frames_processed = frames_processed_.load();
  s.detections = detections_.load();
  s.errors = error_count_.load();
  s.consecutive_errors = consecutive_errors_.load();
  s.optimization_level = optimizer_.level();
  std::lock_guard<std::mutex> g(stat_mu_);
  s.fps = fps_;
  s.last_detection = last_detection_;
  s.monitoring_active = monitoring_active_;
  return s;
}

StatSnapshot Pipeline::stats() const {
  StatSnapshot s = metrics_.snapshot();
  s.optimization_level = optimizer_.level();
  std::lock_guard<std::mutex> g(stat_mu_);
  s.fps = fps_;
  return s;
}

ValidationStats Pipeline::validation_stats() const {
  std::lock_guard<std::mutex> g(stat_mu_);
  return validation_stats_;
}
