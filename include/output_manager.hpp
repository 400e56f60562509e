#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <mutex>
#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "health.hpp"
#include "types.hpp"
#include "util.hpp"

struct PerformanceStats {
  uint64_t total_frames = 0;
  uint64_t total_detections = 0;
  uint64_t total_cats = 0;
  uint64_t images_saved = 0;
  uint64_t save_failures = 0;
  double total_confidence = 0.0;

  std::chrono::steady_clock::time_point start_time;
  std::chrono::steady_clock::time_point last_summary;

  void reset() {
    total_frames = 0;
    total_detections = 0;
    total_cats = 0;
    images_saved = 0;
    save_failures = 0;
    total_confidence = 0.0;
    start_time = std::chrono::steady_clock::now();
    last_summary = start_time;
  }

  double getAvgConfidence() const {
    return total_detections > 0 ? total_confidence / static_cast<double>(total_detections) : 0.0;
  }

  double getFPS() const {
    auto now = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time);
    double seconds = static_cast<double>(duration.count()) / 1000.0;
    return seconds > 0 ? static_cast<double>(total_frames) / seconds : 0.0;
  }

  double getFailureRate() const {
    const uint64_t attempts = images_saved + save_failures;
    return attempts > 0 ? static_cast<double>(save_failures) / static_cast<double>(attempts) * 100.0
                        : 0.0;
  }
};

// Persists confirmed detections: a JPEG snapshot per detection under
// data_dir/images and one CSV row per detection in data_dir/detections.csv.
class OutputManager : public HealthCheckable {
public:
  explicit OutputManager(const StorageConfig& config,
                         int performance_summary_interval_s = 300);
  ~OutputManager() override;

  bool initialize();
  void cleanup();

  // Returns the image path, or an empty string if the image could not be written.
  // The CSV row is written either way.
  std::string save_detection(const ValidDetection& detection, const cv::Mat& frame);

  void record_frame();

  // Deletes snapshots older than max_storage_days. Returns the number removed.
  size_t cleanup_old_data();

  void logPerformanceSummary(bool force = false);
  PerformanceStats stats() const;

  void set_config(const StorageConfig& config);

  std::string images_dir() const;
  std::string csv_path() const;

  std::string name() const override { return "output_manager"; }
  bool is_healthy() const override;

  static std::string format_boxes(const std::vector<BoundingBox>& boxes);

private:
  StorageConfig config_;
  int performance_summary_interval_s_;
  mutable std::mutex mu_;
  PerformanceStats stats_;
  std::ofstream csv_file_;
  int consecutive_failures_{0};

  void initializeCSV();
  void writeCSVRow(const ValidDetection& detection, const std::string& image_path);
  void closeCSV();
  std::string image_path_for(WallTime t) const;
};
