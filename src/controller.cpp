#include "controller.hpp"

#include <algorithm>

LevelDecision LevelController::decide(int current, const PerformanceMetrics& latest,
                                      const std::deque<PerformanceMetrics>& history) const {
  current = std::clamp(current, 0, kMaxLevel);
  const auto& s = levels_[static_cast<size_t>(current)];

  if (latest.cpu_percent > s.max_cpu_percent || latest.memory_percent > s.max_memory_percent) {
    if (current < kMaxLevel) return {current + 1, "cpu or memory above level threshold"};
    return {current, "already at most aggressive level"};
  }

  if (latest.cpu_percent < s.max_cpu_percent * kRecoverFraction &&
      latest.memory_percent < s.max_memory_percent * kRecoverFraction) {
    if (current == 0) return {current, "no-change"};
    if (history.size() < kSustainSamples) return {current, "not enough samples to relax"};

    double cpu = 0.0;
    double mem = 0.0;
    for (auto it = history.end() - static_cast<long>(kSustainSamples); it != history.end(); ++it) {
      cpu += it->cpu_percent;
      mem += it->memory_percent;
    }
    cpu /= static_cast<double>(kSustainSamples);
    mem /= static_cast<double>(kSustainSamples);

    if (cpu < s.max_cpu_percent * kSustainFraction && mem < s.max_memory_percent * kSustainFraction)
      return {current - 1, "sustained low cpu and memory"};
    return {current, "recent average still high"};
  }

  return {current, "no-change"};
}
