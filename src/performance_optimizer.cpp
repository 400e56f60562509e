#include "performance_optimizer.hpp"

#include <malloc.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace {
const std::array<OptimizationSettings, 3> kLevels{{
    // fps  cpu   mem   downsample skip gc   caching roi
    {1.0, 50.0, 70.0, 1.0, 0, 100, true, true},
    {0.8, 60.0, 75.0, 0.8, 1, 50, false, true},
    {0.5, 70.0, 80.0, 0.6, 2, 25, false, true},
}};

const std::array<DetectionParameters, 3> kDetectionParams{{
    // scale neighbors min max blur alpha beta roi
    {1.1, 3, 30, 300, 3, 1.2, 10.0, 1.0},
    {1.2, 2, 40, 250, 5, 1.1, 5.0, 1.0},
    {1.3, 2, 50, 200, 7, 1.0, 0.0, 0.8},
}};

size_t level_index(int level) { return static_cast<size_t>(std::clamp(level, 0, 2)); }
}  // namespace

PerformanceOptimizer::PerformanceOptimizer(ErrorHandler& errors, ConfigManager& config,
                                           SystemMetricsProvider& system,
                                           std::chrono::milliseconds interval)
    : errors_(errors),
      config_(config),
      system_(system),
      interval_(interval),
      controller_(kLevels),
      reclaim_([] { malloc_trim(0); }) {
  errors_.register_component(name());
  config_callback_ = config_.add_change_callback([this](const AppConfig& c) { reassert_level(c); });
  spdlog::info("Performance optimizer initialized (interval {} ms)", interval_.count());
}

PerformanceOptimizer::~PerformanceOptimizer() {
  stop_monitoring();
  config_.remove_change_callback(config_callback_);
}

const std::array<OptimizationSettings, 3>& PerformanceOptimizer::level_table() { return kLevels; }

DetectionParameters PerformanceOptimizer::detection_parameters_for(int level) {
  return kDetectionParams[level_index(level)];
}

void PerformanceOptimizer::start_monitoring() {
  if (monitoring_.exchange(true)) return;
  monitor_thread_ = std::thread([this] { monitor_loop(); });
  spdlog::info("Performance monitoring started");
}

void PerformanceOptimizer::stop_monitoring() {
  {
    std::lock_guard<std::mutex> lk(wait_mu_);
    if (!monitoring_.exchange(false)) return;
  }
  wait_cv_.notify_all();
  if (monitor_thread_.joinable()) monitor_thread_.join();
  spdlog::info("Performance monitoring stopped");
}

void PerformanceOptimizer::sleep_for(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(wait_mu_);
  wait_cv_.wait_for(lk, d, [this] { return !monitoring_.load(); });
}

void PerformanceOptimizer::monitor_loop() {
  while (monitoring_) {
    try {
      evaluate(collect_metrics());
      sleep_for(interval_);
    } catch (const std::exception& e) {
      spdlog::error("Error in monitoring loop: {}", e.what());
      errors_.handle_error(name(), e, ErrorSeverity::MEDIUM, "monitoring loop");
      sleep_for(kErrorBackoff);
    }
  }
}

// A failed read still yields a sample: zero load, no temperature.
PerformanceMetrics PerformanceOptimizer::collect_metrics() {
  PerformanceMetrics m;
  m.timestamp = WallClock::now();
  try {
    const SystemSample s = system_.sample();
    m.cpu_percent = s.cpu_percent;
    m.memory_percent = s.memory_percent;
    m.memory_available_mb = s.memory_available_mb;
    m.temperature_celsius = s.temperature_celsius;
  } catch (const std::exception& e) {
    spdlog::error("Error collecting system metrics: {}", e.what());
    if (!monitor_failing_.exchange(true))
      errors_.handle_error(name(), e, ErrorSeverity::MEDIUM, "collecting system metrics");
    return m;
  }
  if (monitor_failing_.exchange(false)) errors_.mark_component_healthy(name());
  return m;
}

LevelDecision PerformanceOptimizer::evaluate(const PerformanceMetrics& sample) {
  LevelDecision d;
  int previous = 0;
  {
    std::lock_guard<std::mutex> g(mu_);
    history_.push_back(sample);
    while (history_.size() > kHistoryCapacity) history_.pop_front();
    previous = level_;
    d = controller_.decide(level_, sample, history_);
    level_ = d.level;
  }

  if (d.level != previous) {
    if (d.level > previous) {
      spdlog::warn("Performance degraded - switching to optimization level {} ({})", d.level,
                   d.reason);
    } else {
      spdlog::info("Performance improved - switching to optimization level {} ({})", d.level,
                   d.reason);
    }
    apply_level(d.level);
  }

  std::vector<PerformanceCallback> cbs;
  {
    std::lock_guard<std::mutex> g(cb_mu_);
    cbs = perf_callbacks_;
  }
  for (auto& cb : cbs) {
    try {
      cb(sample);
    } catch (const std::exception& e) {
      spdlog::error("Error in performance callback: {}", e.what());
    }
  }
  return d;
}

void PerformanceOptimizer::write_level_config(int level) {
  const auto& s = kLevels[level_index(level)];
  const bool applied = config_.update([&](AppConfig& c) {
    c.performance.target_fps = s.target_fps;
    c.performance.max_cpu_usage = s.max_cpu_percent;
  });
  if (!applied) {
    errors_.handle_error(name(), "ConfigUpdateRejected",
                         "could not apply optimization level " + std::to_string(level),
                         ErrorSeverity::LOW);
  }
}

// A reload or external update can replace the values this level wrote.
void PerformanceOptimizer::reassert_level(const AppConfig& c) {
  const int lvl = level();
  if (lvl == 0) return;
  const auto& s = kLevels[level_index(lvl)];
  if (c.performance.target_fps == s.target_fps && c.performance.max_cpu_usage == s.max_cpu_percent)
    return;
  spdlog::info("Restoring optimization level {} settings after configuration change", lvl);
  write_level_config(lvl);
}

void PerformanceOptimizer::apply_level(int level) {
  const auto& s = kLevels[level_index(level)];
  write_level_config(level);
  spdlog::info("Applied optimization level {}: FPS={}, CPU={}%", level, s.target_fps,
               s.max_cpu_percent);

  std::vector<LevelListener> listeners;
  {
    std::lock_guard<std::mutex> g(cb_mu_);
    listeners = level_listeners_;
  }
  const auto params = detection_parameters_for(level);
  for (auto& l : listeners) {
    try {
      l(level, s, params);
    } catch (const std::exception& e) {
      spdlog::error("Error in level listener: {}", e.what());
    }
  }
}

std::optional<cv::Mat> PerformanceOptimizer::optimize_frame_processing(const cv::Mat& frame,
                                                                        uint64_t frame_number) {
  OptimizationSettings s;
  bool reclaim = false;
  ReclaimHook hook;
  {
    std::lock_guard<std::mutex> g(mu_);
    frame_count_ = frame_number;
    s = kLevels[level_index(level_)];

    if (s.detection_skip_frames > 0) {
      skip_frame_counter_++;
      if (skip_frame_counter_ <= s.detection_skip_frames) return std::nullopt;
      skip_frame_counter_ = 0;
    }

    if (frame_number - last_gc_frame_ >= static_cast<uint64_t>(s.gc_frequency_frames)) {
      last_gc_frame_ = frame_number;
      reclaim = true;
      hook = reclaim_;
    }
  }

  cv::Mat out = frame;
  if (s.frame_downsample_factor < 1.0 && !frame.empty()) {
    const int w = static_cast<int>(frame.cols * s.frame_downsample_factor);
    const int h = static_cast<int>(frame.rows * s.frame_downsample_factor);
    if (w > 0 && h > 0) cv::resize(frame, out, cv::Size(w, h), 0, 0, cv::INTER_LINEAR);
  }

  if (reclaim) {
    if (hook) hook();
    reclaim_count_.fetch_add(1);
    spdlog::debug("Memory reclaim pass at frame {}", frame_number);
  }
  return out;
}

void PerformanceOptimizer::update_pipeline_metrics(double fps, double processing_time_ms,
                                                   double detection_time_ms,
                                                   uint64_t total_detections,
                                                   uint64_t error_count) {
  std::lock_guard<std::mutex> g(mu_);
  if (history_.empty()) return;
  auto& latest = history_.back();
  latest.fps = fps;
  latest.frame_processing_time_ms = processing_time_ms;
  latest.detection_time_ms = detection_time_ms;
  latest.total_detections = total_detections;
  latest.error_count = error_count;
}

int PerformanceOptimizer::level() const {
  std::lock_guard<std::mutex> g(mu_);
  return level_;
}

OptimizationSettings PerformanceOptimizer::current_settings() const {
  return kLevels[level_index(level())];
}

DetectionParameters PerformanceOptimizer::detection_parameters() const {
  return detection_parameters_for(level());
}

std::optional<PerformanceMetrics> PerformanceOptimizer::get_current_metrics() const {
  std::lock_guard<std::mutex> g(mu_);
  if (history_.empty()) return std::nullopt;
  return history_.back();
}

std::vector<PerformanceMetrics> PerformanceOptimizer::get_recent_metrics(size_t count) const {
  std::lock_guard<std::mutex> g(mu_);
  const size_t n = std::min(count, history_.size());
  return std::vector<PerformanceMetrics>(history_.end() - static_cast<long>(n), history_.end());
}

PerformanceSummary PerformanceOptimizer::performance_summary() const {
  PerformanceSummary s;
  const auto recent = get_recent_metrics(kSummaryWindow);
  {
    std::lock_guard<std::mutex> g(mu_);
    s.optimization_level = level_;
    s.settings = kLevels[level_index(level_)];
    s.total_frames_processed = frame_count_;
    s.metrics_count = history_.size();
  }
  if (recent.empty()) return s;

  s.has_data = true;
  for (const auto& m : recent) {
    s.avg_cpu_percent += m.cpu_percent;
    s.avg_memory_percent += m.memory_percent;
    s.avg_fps += m.fps;
    s.avg_processing_time_ms += m.frame_processing_time_ms;
  }
  const double n = static_cast<double>(recent.size());
  s.avg_cpu_percent /= n;
  s.avg_memory_percent /= n;
  s.avg_fps /= n;
  s.avg_processing_time_ms /= n;
  s.latest = recent.back();
  return s;
}

std::vector<std::string> PerformanceOptimizer::recommendations() const {
  const auto m = get_current_metrics();
  if (!m) return {"No performance data available"};

  std::vector<std::string> out;
  if (m->cpu_percent > 70.0)
    out.push_back("High CPU usage detected - consider reducing frame rate or detection frequency");
  if (m->memory_percent > 80.0)
    out.push_back("High memory usage detected - consider more frequent memory reclaim");
  if (m->temperature_celsius && *m->temperature_celsius > 70.0)
    out.push_back("High CPU temperature detected - consider adding cooling or reducing load");
  if (m->fps < 0.5)
    out.push_back("Very low FPS detected - consider tuning detection parameters or resolution");
  if (m->frame_processing_time_ms > 2000.0)
    out.push_back("High frame processing time - consider frame downsampling or ROI optimization");
  if (out.empty()) out.push_back("Performance is within acceptable parameters");
  return out;
}

void PerformanceOptimizer::add_performance_callback(PerformanceCallback cb) {
  std::lock_guard<std::mutex> g(cb_mu_);
  perf_callbacks_.push_back(std::move(cb));
}

void PerformanceOptimizer::add_level_listener(LevelListener cb) {
  std::lock_guard<std::mutex> g(cb_mu_);
  level_listeners_.push_back(std::move(cb));
}

void PerformanceOptimizer::set_reclaim_hook(ReclaimHook hook) {
  std::lock_guard<std::mutex> g(mu_);
  reclaim_ = std::move(hook);
}
