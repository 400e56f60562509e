#include "util.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["detection"]) {
    auto d = y["detection"];
    if (d["confidence_threshold"])
      c.detection.confidence_threshold = d["confidence_threshold"].as<float>();
    if (d["roi"]) {
      auto roi = d["roi"].as<std::vector<int>>();
      if (roi.size() != 4) throw YAML::Exception(d["roi"].Mark(), "roi needs 4 values");
      c.detection.roi = Roi{roi[0], roi[1], roi[2], roi[3]};
    }
    if (d["sensitivity"]) c.detection.sensitivity = d["sensitivity"].as<std::string>();
    if (d["min_detection_size"])
      c.detection.min_detection_size = d["min_detection_size"].as<int>();
    if (d["temporal_consistency_frames"])
      c.detection.temporal_consistency_frames = d["temporal_consistency_frames"].as<int>();
    if (d["cascade_path"]) c.detection.cascade_path = d["cascade_path"].as<std::string>();
  }
  if (y["schedule"]) {
    auto s = y["schedule"];
    if (s["enabled"]) c.schedule.enabled = s["enabled"].as<bool>();
    if (s["start_hour"]) c.schedule.start_hour = s["start_hour"].as<int>();
    if (s["end_hour"]) c.schedule.end_hour = s["end_hour"].as<int>();
    if (s["days"]) {
      auto days = s["days"].as<std::vector<bool>>();
      if (days.size() != 7) throw YAML::Exception(s["days"].Mark(), "days needs 7 values");
      for (size_t i = 0; i < 7; ++i) c.schedule.days[i] = days[i];
    }
  }
  if (y["notifications"]) {
    auto n = y["notifications"];
    if (n["push_enabled"]) c.notifications.push_enabled = n["push_enabled"].as<bool>();
    if (n["email_enabled"]) c.notifications.email_enabled = n["email_enabled"].as<bool>();
    if (n["cooldown_minutes"])
      c.notifications.cooldown_minutes = n["cooldown_minutes"].as<int>();
    if (n["max_per_hour"]) c.notifications.max_per_hour = n["max_per_hour"].as<int>();
    if (n["quiet_hours_enabled"])
      c.notifications.quiet_hours_enabled = n["quiet_hours_enabled"].as<bool>();
    if (n["quiet_start"]) c.notifications.quiet_start = n["quiet_start"].as<int>();
    if (n["quiet_end"]) c.notifications.quiet_end = n["quiet_end"].as<int>();
  }
  if (y["storage"]) {
    auto s = y["storage"];
    if (s["data_dir"]) c.storage.data_dir = s["data_dir"].as<std::string>();
    if (s["max_storage_days"]) c.storage.max_storage_days = s["max_storage_days"].as<int>();
    if (s["image_quality"]) c.storage.image_quality = s["image_quality"].as<int>();
    if (s["auto_cleanup"]) c.storage.auto_cleanup = s["auto_cleanup"].as<bool>();
  }
  if (y["performance"]) {
    auto p = y["performance"];
    if (p["target_fps"]) c.performance.target_fps = p["target_fps"].as<double>();
    if (p["max_cpu_usage"]) c.performance.max_cpu_usage = p["max_cpu_usage"].as<double>();
    if (p["adaptive"]) c.performance.adaptive = p["adaptive"].as<bool>();
    if (p["monitor_interval_s"])
      c.performance.monitor_interval_s = p["monitor_interval_s"].as<double>();
  }
  if (y["input"]) {
    if (y["input"]["uri"]) c.input.uri = y["input"]["uri"].as<std::string>();
    if (y["input"]["width"]) c.input.width = y["input"]["width"].as<int>();
    if (y["input"]["height"]) c.input.height = y["input"]["height"].as<int>();
  }
  if (y["logging"]) {
    auto l = y["logging"];
    if (l["level"]) c.logging.level = l["level"].as<std::string>();
    if (l["file"]) c.logging.file = l["file"].as<std::string>();
    if (l["max_size_mb"]) c.logging.max_size_mb = l["max_size_mb"].as<int>();
    if (l["max_files"]) c.logging.max_files = l["max_files"].as<int>();
  }
  if (y["telemetry"] && y["telemetry"]["http_port"])
    c.http_port = y["telemetry"]["http_port"].as<int>();

  return c;
}

namespace {
bool valid_hour(int h) { return h >= 0 && h <= 23; }
}  // namespace

std::vector<std::string> validate_config(const AppConfig& c) {
  std::vector<std::string> problems;
  const auto& d = c.detection;

  if (!(d.confidence_threshold >= 0.0f && d.confidence_threshold <= 1.0f))
    problems.push_back("detection.confidence_threshold must be within [0, 1]");
  if (d.sensitivity != "low" && d.sensitivity != "medium" && d.sensitivity != "high")
    problems.push_back("detection.sensitivity must be low, medium or high");
  if (d.min_detection_size < 10) problems.push_back("detection.min_detection_size must be >= 10");
  if (d.temporal_consistency_frames < 1)
    problems.push_back("detection.temporal_consistency_frames must be >= 1");
  if (d.roi.x < 0 || d.roi.y < 0 || d.roi.width <= 0 || d.roi.height <= 0)
    problems.push_back("detection.roi must have non-negative origin and positive size");

  if (!valid_hour(c.schedule.start_hour) || !valid_hour(c.schedule.end_hour))
    problems.push_back("schedule hours must be within 0..23");

  const auto& n = c.notifications;
  if (n.cooldown_minutes < 0) problems.push_back("notifications.cooldown_minutes must be >= 0");
  if (n.max_per_hour < 1) problems.push_back("notifications.max_per_hour must be >= 1");
  if (!valid_hour(n.quiet_start) || !valid_hour(n.quiet_end))
    problems.push_back("notifications quiet hours must be within 0..23");

  if (c.storage.max_storage_days < 1) problems.push_back("storage.max_storage_days must be >= 1");
  if (c.storage.image_quality < 1 || c.storage.image_quality > 100)
    problems.push_back("storage.image_quality must be within 1..100");

  if (!(c.performance.target_fps > 0.0)) problems.push_back("performance.target_fps must be > 0");
  if (!(c.performance.max_cpu_usage > 0.0))
    problems.push_back("performance.max_cpu_usage must be > 0");
  if (!(c.performance.monitor_interval_s > 0.0))
    problems.push_back("performance.monitor_interval_s must be > 0");

  return problems;
}

bool apply_sensitivity(AppConfig& c, const std::string& sensitivity) {
  auto& d = c.detection;
  if (sensitivity == "low") {
    d.confidence_threshold = 0.8f;
    d.min_detection_size = 80;
    d.temporal_consistency_frames = 3;
  } else if (sensitivity == "medium") {
    d.confidence_threshold = 0.7f;
    d.min_detection_size = 50;
    d.temporal_consistency_frames = 2;
  } else if (sensitivity == "high") {
    d.confidence_threshold = 0.6f;
    d.min_detection_size = 30;
    d.temporal_consistency_frames = 1;
  } else {
    return false;
  }
  d.sensitivity = sensitivity;
  return true;
}

namespace {
// Inclusive hour window; start > end wraps past midnight.
bool hour_in_window(int hour, int start, int end) {
  if (start <= end) return start <= hour && hour <= end;
  return hour >= start || hour <= end;
}
}  // namespace

bool is_monitoring_active(const ScheduleConfig& s, const std::tm& now) {
  if (!s.enabled) return false;
  const int weekday = (now.tm_wday + 6) % 7;  // tm_wday counts from Sunday
  if (!s.days[static_cast<size_t>(weekday)]) return false;
  return hour_in_window(now.tm_hour, s.start_hour, s.end_hour);
}

bool is_quiet_hour(const NotificationConfig& n, int hour) {
  if (!n.quiet_hours_enabled) return false;
  return hour_in_window(hour, n.quiet_start, n.quiet_end);
}

void setup_logging(const LoggingConfig& cfg) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!cfg.file.empty()) {
    try {
      const auto parent = std::filesystem::path(cfg.file).parent_path();
      if (!parent.empty()) std::filesystem::create_directories(parent);
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          cfg.file, static_cast<size_t>(cfg.max_size_mb) * 1024 * 1024,
          static_cast<size_t>(cfg.max_files)));
    } catch (const std::exception& e) {
      // Console logging still works; keep going without the file sink.
      spdlog::warn("Could not open log file '{}': {}", cfg.file, e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("cat_counter", sinks.begin(), sinks.end());
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");

  if (cfg.level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (cfg.level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (cfg.level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::set_level(spdlog::level::info);
  }
}
