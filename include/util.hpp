#pragma once
#include <array>
#include <ctime>
#include <string>
#include <vector>

#include "types.hpp"

struct DetectionConfig {
  float confidence_threshold{0.7f};
  Roi roi{};
  std::string sensitivity{"medium"};  // low, medium, high
  int min_detection_size{50};         // pixel area
  int temporal_consistency_frames{2};
  std::string cascade_path{"models/haarcascade_frontalcatface.xml"};
};

struct ScheduleConfig {
  bool enabled{true};
  int start_hour{0};
  int end_hour{23};
  std::array<bool, 7> days{{true, true, true, true, true, true, true}};  // Mon..Sun
};

struct NotificationConfig {
  bool push_enabled{true};
  bool email_enabled{false};
  int cooldown_minutes{5};
  int max_per_hour{12};
  bool quiet_hours_enabled{false};
  int quiet_start{22};
  int quiet_end{7};
};

struct StorageConfig {
  std::string data_dir{"data"};
  int max_storage_days{30};
  int image_quality{85};
  bool auto_cleanup{true};
};

struct PerformanceConfig {
  double target_fps{1.0};
  double max_cpu_usage{50.0};
  bool adaptive{true};
  double monitor_interval_s{3.0};
};

struct InputConfig {
  std::string uri{"0"};
  int width{640};
  int height{480};
};

struct LoggingConfig {
  std::string level{"info"};
  std::string file{"logs/cat_counter.log"};
  int max_size_mb{10};
  int max_files{5};
};

struct AppConfig {
  DetectionConfig detection;
  ScheduleConfig schedule;
  NotificationConfig notifications;
  StorageConfig storage;
  PerformanceConfig performance;
  InputConfig input;
  LoggingConfig logging;
  int http_port{8080};
};

// Throws YAML::Exception on unreadable or malformed files.
AppConfig load_config(const std::string& path);

// Empty result means the config is usable.
std::vector<std::string> validate_config(const AppConfig& c);

// low / medium / high presets for threshold, minimum size and temporal frames.
bool apply_sensitivity(AppConfig& c, const std::string& sensitivity);

bool is_monitoring_active(const ScheduleConfig& s, const std::tm& now);
bool is_quiet_hour(const NotificationConfig& n, int hour);

void setup_logging(const LoggingConfig& cfg);
