#include "system_metrics.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <vector>

std::optional<CpuTimes> parse_proc_stat(std::istream& in) {
  std::string line;
  while (std::getline(in, line)) {
    if (line.rfind("cpu ", 0) != 0) continue;
    std::istringstream ls(line.substr(4));
    std::vector<uint64_t> fields;
    uint64_t v = 0;
    while (ls >> v) fields.push_back(v);
    if (fields.size() < 4) return std::nullopt;

    CpuTimes t;
    // user nice system idle iowait irq softirq steal ...
    t.idle = fields[3] + (fields.size() > 4 ? fields[4] : 0);
    for (size_t i = 0; i < fields.size() && i < 8; ++i) t.total += fields[i];
    return t;
  }
  return std::nullopt;
}

std::optional<MemInfo> parse_meminfo(std::istream& in) {
  MemInfo m;
  bool have_total = false;
  bool have_avail = false;
  std::string key;
  uint64_t value = 0;
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream ls(line);
    if (!(ls >> key >> value)) continue;
    if (key == "MemTotal:") {
      m.total_kb = value;
      have_total = true;
    } else if (key == "MemAvailable:") {
      m.available_kb = value;
      have_avail = true;
    }
  }
  if (!have_total || !have_avail || m.total_kb == 0) return std::nullopt;
  return m;
}

ProcSystemMetrics::ProcSystemMetrics(std::string proc_root, std::string thermal_path)
    : proc_root_(std::move(proc_root)), thermal_path_(std::move(thermal_path)) {}

SystemSample ProcSystemMetrics::sample() {
  SystemSample s;
  s.cpu_percent = cpu_percent();
  memory(s);
  s.temperature_celsius = temperature();
  return s;
}

double ProcSystemMetrics::cpu_percent() {
  std::ifstream f(proc_root_ + "/stat");
  auto now = f ? parse_proc_stat(f) : std::nullopt;
  if (!now) {
    spdlog::debug("CPU usage unavailable from {}/stat", proc_root_);
    return 0.0;
  }

  std::lock_guard<std::mutex> g(mu_);
  double pct = 0.0;
  if (prev_cpu_ && now->total > prev_cpu_->total) {
    const double dt = static_cast<double>(now->total - prev_cpu_->total);
    const uint64_t idle_delta = now->idle >= prev_cpu_->idle ? now->idle - prev_cpu_->idle : 0;
    pct = (1.0 - static_cast<double>(idle_delta) / dt) * 100.0;
    if (pct < 0.0) pct = 0.0;
    if (pct > 100.0) pct = 100.0;
  }
  prev_cpu_ = now;
  return pct;
}

void ProcSystemMetrics::memory(SystemSample& s) const {
  std::ifstream f(proc_root_ + "/meminfo");
  auto m = f ? parse_meminfo(f) : std::nullopt;
  if (!m) {
    spdlog::debug("Memory usage unavailable from {}/meminfo", proc_root_);
    return;
  }
  const uint64_t used = m->total_kb > m->available_kb ? m->total_kb - m->available_kb : 0;
  s.memory_percent = static_cast<double>(used) / static_cast<double>(m->total_kb) * 100.0;
  s.memory_available_mb = static_cast<double>(m->available_kb) / 1024.0;
}

std::optional<double> ProcSystemMetrics::temperature() const {
  std::ifstream file(thermal_path_);
  long milli = 0;
  if (!(file >> milli)) return std::nullopt;
  return static_cast<double>(milli) / 1000.0;
}
