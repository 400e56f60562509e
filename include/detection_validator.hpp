#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "health.hpp"
#include "types.hpp"
#include "util.hpp"

struct ValidationStats {
  float confidence_threshold{0.0f};
  int min_detection_size{0};
  Roi counter_roi{};
  int temporal_consistency_frames{1};
  size_t window_size{0};
  double horizon_seconds{0.0};

  uint64_t examined{0};
  uint64_t accepted{0};
  uint64_t rejected_confidence{0};
  uint64_t rejected_size{0};
  uint64_t rejected_position{0};
  uint64_t rejected_temporal{0};
};

// Turns raw detector output into counter-confirmed cat detections. Keeps a short
// history of raw detections so a cat has to show up in several frames before it
// counts. Not thread-safe; owned by the pipeline thread.
class DetectionValidator : public HealthCheckable {
public:
  using NowFn = std::function<WallTime()>;

  static constexpr std::chrono::seconds kWindowHorizon{5};
  static constexpr size_t kMaxWindowSize = 50;
  // Applied to raw confidence of accepted detections, capped at 1.0.
  static constexpr float kConfidenceBoost = 1.1f;

  explicit DetectionValidator(const DetectionConfig& cfg = DetectionConfig{},
                              NowFn now = [] { return WallClock::now(); });

  // Output preserves input order. Every raw input enters the history window,
  // accepted or not.
  std::vector<ValidDetection> validate_detections(const std::vector<Detection>& detections);

  // Cats after suppressing overlapping detections, higher confidence first.
  int count_cats(const std::vector<ValidDetection>& detections) const;

  bool is_on_counter(const Detection& detection) const;

  void set_confidence_threshold(float threshold);
  void set_counter_roi(const Roi& roi);
  void set_min_detection_size(int min_size);
  void set_temporal_consistency_frames(int frames);
  void apply(const DetectionConfig& cfg);

  float confidence_threshold() const { return confidence_threshold_; }
  int min_detection_size() const { return min_detection_size_; }
  const Roi& counter_roi() const { return counter_roi_; }
  int temporal_consistency_frames() const { return temporal_consistency_frames_; }
  size_t window_size() const { return recent_.size(); }

  ValidationStats stats() const;

  std::string name() const override { return "detection_validator"; }
  bool is_healthy() const override;

private:
  float confidence_threshold_;
  int min_detection_size_;
  Roi counter_roi_;
  int temporal_consistency_frames_;
  NowFn now_;

  std::deque<Detection> recent_;
  ValidationStats counters_{};

  bool passes_confidence(const Detection& d) const;
  bool passes_size(const Detection& d) const;
  bool passes_temporal(const Detection& d) const;
  ValidDetection make_valid(const Detection& d) const;
  void update_window(const std::vector<Detection>& detections);
};
