#include "cat_detector.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <opencv2/imgproc.hpp>

#include "geometry.hpp"

void CascadeCatDetector::PerformanceStats::update(double inference_ms) {
  frames_processed++;
  avg_inference_ms += (inference_ms - avg_inference_ms) / static_cast<double>(frames_processed);
}

void CascadeCatDetector::PerformanceStats::reset() {
  avg_inference_ms = 0.0;
  frames_processed = 0;
}

CascadeCatDetector::CascadeCatDetector(const DetectionConfig& cfg)
    : cascade_path_(cfg.cascade_path), roi_(cfg.roi) {}

bool CascadeCatDetector::initialize() {
  spdlog::info("Loading cat cascade from {}", cascade_path_);
  try {
    loaded_ = classifier_.load(cascade_path_);
  } catch (const cv::Exception& e) {
    spdlog::error("Cascade load failed: {}", e.what());
    loaded_ = false;
  }
  if (!loaded_) {
    spdlog::error("Failed to load cascade classifier: {}", cascade_path_);
    return false;
  }
  spdlog::info("Cat detector initialized");
  return true;
}

cv::Mat CascadeCatDetector::preprocess(const cv::Mat& frame, const DetectionParameters& params) {
  cv::Mat gray;
  if (frame.channels() == 3) {
    cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
  } else if (frame.channels() == 4) {
    cv::cvtColor(frame, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = frame.clone();
  }

  if (params.blur_kernel_size > 1) {
    int k = params.blur_kernel_size;
    if (k % 2 == 0) k++;
    cv::GaussianBlur(gray, gray, cv::Size(k, k), 0);
  }

  cv::Mat out;
  cv::convertScaleAbs(gray, out, params.contrast_alpha, params.brightness_beta);
  return out;
}

float CascadeCatDetector::weight_to_confidence(double level_weight) {
  return clamp_confidence(static_cast<float>(1.0 / (1.0 + std::exp(-level_weight))));
}

namespace {
// Exact integer rescale of a coordinate from `from` pixels to `to` pixels.
int scale_floor(int v, int to, int from) {
  return static_cast<int>((static_cast<int64_t>(v) * to) / from);
}
int scale_ceil(int v, int to, int from) {
  return static_cast<int>((static_cast<int64_t>(v) * to + from - 1) / from);
}
}  // namespace

cv::Rect roi_search_rect(const Roi& roi, double shrink, const cv::Size& frame_size,
                         const cv::Size& source_size) {
  const Roi r = shrink_roi(roi, shrink);
  const cv::Rect bounds(0, 0, frame_size.width, frame_size.height);
  cv::Rect out;
  if (source_size.width <= 0 || source_size.height <= 0 || source_size == frame_size) {
    out = cv::Rect(r.x, r.y, r.width, r.height) & bounds;
  } else {
    const int x0 = scale_floor(std::max(r.x, 0), frame_size.width, source_size.width);
    const int y0 = scale_floor(std::max(r.y, 0), frame_size.height, source_size.height);
    const int x1 = scale_ceil(std::max(r.x + r.width, 0), frame_size.width, source_size.width);
    const int y1 = scale_ceil(std::max(r.y + r.height, 0), frame_size.height, source_size.height);
    out = cv::Rect(x0, y0, x1 - x0, y1 - y0) & bounds;
  }
  if (out.area() <= 0) return cv::Rect();
  return out;
}

std::vector<Detection> CascadeCatDetector::detect(const cv::Mat& frame,
                                                  const cv::Size& source_size) {
  std::vector<Detection> out;
  if (!loaded_ || frame.empty()) return out;

  DetectionParameters params;
  bool restrict = false;
  Roi roi;
  {
    std::lock_guard<std::mutex> g(mu_);
    params = params_;
    restrict = restrict_to_roi_;
    roi = roi_;
  }

  const auto t0 = std::chrono::steady_clock::now();

  cv::Rect search(0, 0, frame.cols, frame.rows);
  if (restrict) {
    search = roi_search_rect(roi, params.roi_shrink, frame.size(), source_size);
    if (search.area() <= 0) return out;
  }

  cv::Mat gray = preprocess(frame(search), params);

  std::vector<cv::Rect> hits;
  std::vector<int> reject_levels;
  std::vector<double> level_weights;
  classifier_.detectMultiScale(gray, hits, reject_levels, level_weights, params.scale_factor,
                               params.min_neighbors, 0,
                               cv::Size(params.min_size, params.min_size),
                               cv::Size(params.max_size, params.max_size), true);

  const WallTime now = WallClock::now();
  for (size_t i = 0; i < hits.size(); ++i) {
    const float conf = i < level_weights.size() ? weight_to_confidence(level_weights[i]) : 0.0f;
    BoundingBox b{hits[i].x + search.x, hits[i].y + search.y, hits[i].width, hits[i].height, conf};

    Detection d;
    d.timestamp = now;
    d.bounding_boxes.push_back(b);
    d.frame_width = frame.cols;
    d.frame_height = frame.rows;
    d.raw_confidence = conf;
    out.push_back(std::move(d));
  }

  const double ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
  {
    std::lock_guard<std::mutex> g(mu_);
    stats_.update(ms);
  }
  spdlog::debug("Cascade found {} candidates in {:.1f} ms", out.size(), ms);
  return out;
}

void CascadeCatDetector::apply_parameters(const DetectionParameters& params, bool restrict_to_roi) {
  std::lock_guard<std::mutex> g(mu_);
  params_ = params;
  restrict_to_roi_ = restrict_to_roi;
  spdlog::info("Detector parameters: scale={} neighbors={} size={}..{} blur={} roi_only={}",
               params.scale_factor, params.min_neighbors, params.min_size, params.max_size,
               params.blur_kernel_size, restrict_to_roi);
}

void CascadeCatDetector::set_roi(const Roi& roi) {
  std::lock_guard<std::mutex> g(mu_);
  roi_ = roi;
}

bool CascadeCatDetector::is_healthy() const { return loaded_ && !classifier_.empty(); }

DetectionParameters CascadeCatDetector::parameters() const {
  std::lock_guard<std::mutex> g(mu_);
  return params_;
}

CascadeCatDetector::PerformanceStats CascadeCatDetector::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  return stats_;
}

std::unique_ptr<CatDetector> createCatDetector(const DetectionConfig& cfg) {
  return std::make_unique<CascadeCatDetector>(cfg);
}
