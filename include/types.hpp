#pragma once
#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using WallClock = std::chrono::system_clock;
using WallTime = std::chrono::time_point<WallClock>;

struct BoundingBox {
  int x{0};
  int y{0};
  int width{0};
  int height{0};
  float confidence{0.0f};

  int64_t area() const { return static_cast<int64_t>(width) * static_cast<int64_t>(height); }
  int center_x() const { return x + width / 2; }
  int center_y() const { return y + height / 2; }

  bool operator==(const BoundingBox& o) const {
    return x == o.x && y == o.y && width == o.width && height == o.height &&
           confidence == o.confidence;
  }
  bool operator!=(const BoundingBox& o) const { return !(*this == o); }
};

// Counter region of interest, in frame pixels.
struct Roi {
  int x{0};
  int y{0};
  int width{640};
  int height{480};

  bool operator==(const Roi& o) const {
    return x == o.x && y == o.y && width == o.width && height == o.height;
  }
};

// One inference call's output. bounding_boxes is non-empty for well-formed input.
struct Detection {
  WallTime timestamp{};
  std::vector<BoundingBox> bounding_boxes;
  int frame_width{0};
  int frame_height{0};
  float raw_confidence{0.0f};
};

struct ValidDetection : Detection {
  int cat_count{0};
  bool is_on_counter{false};
  float validated_confidence{0.0f};
};

struct PerformanceMetrics {
  WallTime timestamp{};
  double cpu_percent{0.0};
  double memory_percent{0.0};
  double memory_available_mb{0.0};
  std::optional<double> temperature_celsius;
  double fps{0.0};
  double frame_processing_time_ms{0.0};
  double detection_time_ms{0.0};
  uint64_t total_detections{0};
  uint64_t error_count{0};
};

struct OptimizationSettings {
  double target_fps{1.0};
  double max_cpu_percent{50.0};
  double max_memory_percent{70.0};
  double frame_downsample_factor{1.0};
  int detection_skip_frames{0};
  int gc_frequency_frames{100};
  bool enable_frame_caching{true};
  bool enable_roi_optimization{true};
};

// Detector tuning bundle that goes with each optimization level.
struct DetectionParameters {
  double scale_factor{1.1};
  int min_neighbors{3};
  int min_size{30};
  int max_size{300};
  int blur_kernel_size{3};
  double contrast_alpha{1.2};
  double brightness_beta{10.0};
  double roi_shrink{1.0};  // fraction of the ROI kept, centered
};

inline float clamp_confidence(float c) {
  if (!(c >= 0.0f)) return 0.0f;  // also maps NaN to 0
  return c > 1.0f ? 1.0f : c;
}

inline std::string format_time_hms(WallTime t) {
  std::time_t tt = WallClock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}
