#include "detection_validator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "geometry.hpp"

DetectionValidator::DetectionValidator(const DetectionConfig& cfg, NowFn now)
    : confidence_threshold_(clamp_confidence(cfg.confidence_threshold)),
      min_detection_size_(cfg.min_detection_size),
      counter_roi_(cfg.roi),
      temporal_consistency_frames_(std::max(1, cfg.temporal_consistency_frames)),
      now_(std::move(now)) {
  spdlog::info("Detection validator: threshold={:.2f} min_size={} roi=({},{},{},{}) frames={}",
               confidence_threshold_, min_detection_size_, counter_roi_.x, counter_roi_.y,
               counter_roi_.width, counter_roi_.height, temporal_consistency_frames_);
}

std::vector<ValidDetection> DetectionValidator::validate_detections(
    const std::vector<Detection>& detections) {
  std::vector<ValidDetection> out;
  out.reserve(detections.size());

  for (const auto& d : detections) {
    counters_.examined++;
    if (!passes_confidence(d)) {
      counters_.rejected_confidence++;
      continue;
    }
    if (!passes_size(d)) {
      counters_.rejected_size++;
      continue;
    }
    if (!is_on_counter(d)) {
      counters_.rejected_position++;
      continue;
    }
    if (!passes_temporal(d)) {
      counters_.rejected_temporal++;
      continue;
    }
    counters_.accepted++;
    out.push_back(make_valid(d));
  }

  update_window(detections);

  if (!detections.empty())
    spdlog::debug("Validated {} of {} raw detections", out.size(), detections.size());
  return out;
}

int DetectionValidator::count_cats(const std::vector<ValidDetection>& detections) const {
  if (detections.empty()) return 0;

  std::vector<const ValidDetection*> order;
  order.reserve(detections.size());
  for (const auto& d : detections) order.push_back(&d);
  std::stable_sort(order.begin(), order.end(), [](const ValidDetection* a, const ValidDetection* b) {
    return a->validated_confidence > b->validated_confidence;
  });

  std::vector<const ValidDetection*> kept;
  for (const auto* d : order) {
    bool unique = true;
    for (const auto* k : kept) {
      if (detections_similar(*d, *k, kNmsIouThreshold)) {
        unique = false;
        break;
      }
    }
    if (unique) kept.push_back(d);
  }

  int total = 0;
  for (const auto* k : kept) total += k->cat_count;
  spdlog::debug("Counted {} cats from {} unique detections", total, kept.size());
  return total;
}

bool DetectionValidator::is_on_counter(const Detection& detection) const {
  for (const auto& b : detection.bounding_boxes) {
    if (center_in_roi(b, counter_roi_)) return true;
  }
  return false;
}

void DetectionValidator::set_confidence_threshold(float threshold) {
  confidence_threshold_ = clamp_confidence(threshold);
  spdlog::info("Confidence threshold set to {:.2f}", confidence_threshold_);
}

void DetectionValidator::set_counter_roi(const Roi& roi) {
  counter_roi_ = roi;
  spdlog::info("Counter ROI set to ({},{},{},{})", roi.x, roi.y, roi.width, roi.height);
}

void DetectionValidator::set_min_detection_size(int min_size) {
  min_detection_size_ = std::max(0, min_size);
}

void DetectionValidator::set_temporal_consistency_frames(int frames) {
  temporal_consistency_frames_ = std::max(1, frames);
}

void DetectionValidator::apply(const DetectionConfig& cfg) {
  set_confidence_threshold(cfg.confidence_threshold);
  set_counter_roi(cfg.roi);
  set_min_detection_size(cfg.min_detection_size);
  set_temporal_consistency_frames(cfg.temporal_consistency_frames);
}

ValidationStats DetectionValidator::stats() const {
  ValidationStats s = counters_;
  s.confidence_threshold = confidence_threshold_;
  s.min_detection_size = min_detection_size_;
  s.counter_roi = counter_roi_;
  s.temporal_consistency_frames = temporal_consistency_frames_;
  s.window_size = recent_.size();
  s.horizon_seconds = static_cast<double>(kWindowHorizon.count());
  return s;
}

bool DetectionValidator::is_healthy() const {
  return recent_.size() <= kMaxWindowSize && confidence_threshold_ >= 0.0f &&
         confidence_threshold_ <= 1.0f && temporal_consistency_frames_ >= 1;
}

bool DetectionValidator::passes_confidence(const Detection& d) const {
  return d.raw_confidence >= confidence_threshold_;
}

bool DetectionValidator::passes_size(const Detection& d) const {
  for (const auto& b : d.bounding_boxes) {
    if (b.area() >= min_detection_size_) return true;
  }
  return false;
}

bool DetectionValidator::passes_temporal(const Detection& d) const {
  if (temporal_consistency_frames_ <= 1) return true;

  int similar = 0;
  for (const auto& r : recent_) {
    if (d.timestamp - r.timestamp > kWindowHorizon) continue;
    if (detections_similar(d, r, kTemporalIouThreshold)) similar++;
  }
  return similar >= temporal_consistency_frames_ - 1;
}

ValidDetection DetectionValidator::make_valid(const Detection& d) const {
  ValidDetection v;
  static_cast<Detection&>(v) = d;
  v.cat_count = static_cast<int>(
      std::count_if(d.bounding_boxes.begin(), d.bounding_boxes.end(),
                    [this](const BoundingBox& b) { return b.area() >= min_detection_size_; }));
  v.validated_confidence = std::min(d.raw_confidence * kConfidenceBoost, 1.0f);
  v.is_on_counter = true;
  return v;
}

void DetectionValidator::update_window(const std::vector<Detection>& detections) {
  const WallTime now = now_();
  recent_.erase(std::remove_if(recent_.begin(), recent_.end(),
                               [&](const Detection& r) { return now - r.timestamp > kWindowHorizon; }),
                recent_.end());

  for (const auto& d : detections) recent_.push_back(d);
  while (recent_.size() > kMaxWindowSize) recent_.pop_front();
}
