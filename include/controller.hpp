#pragma once
#include <array>
#include <deque>
#include <string>

#include "types.hpp"

struct LevelDecision {
  int level{0};
  std::string reason;
};

// Picks the optimization level for the next cycle from the newest sample and the
// recent history. Moves at most one level per call.
class LevelController {
public:
  static constexpr int kMaxLevel = 2;
  static constexpr double kRecoverFraction = 0.7;  // of the level's thresholds, newest sample
  static constexpr double kSustainFraction = 0.6;  // of the level's thresholds, history average
  static constexpr size_t kSustainSamples = 5;

  explicit LevelController(const std::array<OptimizationSettings, 3>& levels) : levels_(levels) {}

  // history holds the samples so far, newest last, including `latest`.
  LevelDecision decide(int current, const PerformanceMetrics& latest,
                       const std::deque<PerformanceMetrics>& history) const;

private:
  std::array<OptimizationSettings, 3> levels_;
};
