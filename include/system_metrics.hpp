#pragma once
#include <cstdint>
#include <istream>
#include <mutex>
#include <optional>
#include <string>

struct SystemSample {
  double cpu_percent{0.0};
  double memory_percent{0.0};
  double memory_available_mb{0.0};
  std::optional<double> temperature_celsius;
};

class SystemMetricsProvider {
public:
  virtual ~SystemMetricsProvider() = default;
  // Never throws for missing sources; unreadable values come back as 0 or absent.
  virtual SystemSample sample() = 0;
};

struct CpuTimes {
  uint64_t idle{0};
  uint64_t total{0};
};

// First "cpu" line of /proc/stat. Empty when the line is missing or malformed.
std::optional<CpuTimes> parse_proc_stat(std::istream& in);

struct MemInfo {
  uint64_t total_kb{0};
  uint64_t available_kb{0};
};

std::optional<MemInfo> parse_meminfo(std::istream& in);

// Linux implementation backed by /proc and the first thermal zone. CPU usage is
// the busy share since the previous sample(), so the first call reports 0.
class ProcSystemMetrics : public SystemMetricsProvider {
public:
  explicit ProcSystemMetrics(std::string proc_root = "/proc",
                             std::string thermal_path = "/sys/class/thermal/thermal_zone0/temp");

  SystemSample sample() override;

private:
  std::string proc_root_;
  std::string thermal_path_;
  std::mutex mu_;
  std::optional<CpuTimes> prev_cpu_;

  double cpu_percent();
  void memory(SystemSample& s) const;
  std::optional<double> temperature() const;
};
