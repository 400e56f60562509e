#pragma once
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

struct StatSnapshot {
  double frame_p50{0}, frame_p95{0}, frame_p99{0};
  double detect_p50{0}, detect_p95{0}, detect_p99{0};
  double fps{0};
  uint64_t frames_total{0};
  uint64_t frames_skipped{0};
  uint64_t raw_detections_total{0};
  uint64_t valid_detections_total{0};
  uint64_t cats_counted_total{0};
  uint64_t notifications_total{0};
  uint64_t errors_total{0};
  int optimization_level{0};
};

class MetricsRegistry {
public:
  void add_frame_ms(double ms) { frame_.add(ms); }
  void add_detect_ms(double ms) { detect_.add(ms); }

  void inc_frame() { frames_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_skipped() { frames_skipped_.fetch_add(1, std::memory_order_relaxed); }
  void add_raw_detections(uint64_t n) { raw_total_.fetch_add(n, std::memory_order_relaxed); }
  void add_valid_detections(uint64_t n) { valid_total_.fetch_add(n, std::memory_order_relaxed); }
  void add_cats(uint64_t n) { cats_total_.fetch_add(n, std::memory_order_relaxed); }
  void inc_notification() { notifications_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_error() { errors_total_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t frames_total() const { return frames_total_.load(std::memory_order_relaxed); }
  uint64_t valid_detections_total() const { return valid_total_.load(std::memory_order_relaxed); }
  uint64_t errors_total() const { return errors_total_.load(std::memory_order_relaxed); }

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist frame_, detect_;
  std::atomic<uint64_t> frames_total_{0};
  std::atomic<uint64_t> frames_skipped_{0};
  std::atomic<uint64_t> raw_total_{0};
  std::atomic<uint64_t> valid_total_{0};
  std::atomic<uint64_t> cats_total_{0};
  std::atomic<uint64_t> notifications_total_{0};
  std::atomic<uint64_t> errors_total_{0};
};
