#pragma once

#include <memory>
#include <mutex>
#include <opencv2/core.hpp>
#include <opencv2/objdetect.hpp>
#include <string>
#include <vector>

#include "health.hpp"
#include "types.hpp"
#include "util.hpp"

// Source of raw per-frame detections. One Detection per candidate, each with a
// single bounding box in the coordinates of the frame passed to detect().
// source_size is the camera frame size the ROI is expressed in; frame may be a
// downsampled copy of it.
class CatDetector : public HealthCheckable {
public:
  virtual bool initialize() = 0;
  virtual std::vector<Detection> detect(const cv::Mat& frame, const cv::Size& source_size) = 0;

  virtual void apply_parameters(const DetectionParameters& params, bool restrict_to_roi) = 0;
  virtual void set_roi(const Roi& roi) = 0;

  std::string name() const override { return "cat_detector"; }
};

// Haar/LBP cascade detector. Preprocesses to grayscale, blurs, stretches
// contrast and optionally searches only inside the counter ROI.
class CascadeCatDetector : public CatDetector {
public:
  explicit CascadeCatDetector(const DetectionConfig& cfg);

  bool initialize() override;
  std::vector<Detection> detect(const cv::Mat& frame, const cv::Size& source_size) override;

  void apply_parameters(const DetectionParameters& params, bool restrict_to_roi) override;
  void set_roi(const Roi& roi) override;

  bool is_healthy() const override;

  DetectionParameters parameters() const;

  struct PerformanceStats {
    double avg_inference_ms{0.0};
    uint64_t frames_processed{0};

    void update(double inference_ms);
    void reset();
  };

  PerformanceStats stats() const;

  // Prepared grayscale image the cascade runs on.
  static cv::Mat preprocess(const cv::Mat& frame, const DetectionParameters& params);
  // Maps a cascade level weight to [0,1].
  static float weight_to_confidence(double level_weight);

private:
  std::string cascade_path_;
  cv::CascadeClassifier classifier_;
  bool loaded_{false};

  mutable std::mutex mu_;
  DetectionParameters params_{};
  bool restrict_to_roi_{true};
  Roi roi_{};
  PerformanceStats stats_{};
};

// Search window in frame pixels for a counter ROI given in source_size pixels,
// shrunk about its center and clipped to the frame. Empty when they do not overlap.
cv::Rect roi_search_rect(const Roi& roi, double shrink, const cv::Size& frame_size,
                         const cv::Size& source_size);

std::unique_ptr<CatDetector> createCatDetector(const DetectionConfig& cfg);
