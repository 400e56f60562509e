#include "health.hpp"

#include <spdlog/spdlog.h>

const char* to_string(HealthStatus s) {
  switch (s) {
    case HealthStatus::HEALTHY:
      return "healthy";
    case HealthStatus::DEGRADED:
      return "degraded";
    case HealthStatus::CRITICAL:
      return "critical";
  }
  return "unknown";
}

void HealthChecker::register_component(const HealthCheckable& component, int max_failures) {
  std::lock_guard<std::mutex> g(mu_);
  entries_.push_back(Entry{&component, max_failures < 1 ? 1 : max_failures});
  spdlog::debug("Health check registered for {}", component.name());
}

SystemHealthReport HealthChecker::run_checks() {
  std::lock_guard<std::mutex> g(mu_);
  SystemHealthReport report;
  report.timestamp = WallClock::now();

  bool any_unhealthy = false;
  bool any_failed = false;

  for (auto& e : entries_) {
    const std::string name = e.component->name();
    bool ok = false;
    try {
      ok = e.component->is_healthy();
    } catch (const std::exception& ex) {
      spdlog::error("Health check for {} threw: {}", name, ex.what());
      ok = false;
    }

    ComponentCheckResult r;
    r.name = name;
    r.healthy = ok;
    if (ok) {
      if (e.consecutive_failures > 0) spdlog::info("Component {} is healthy again", name);
      e.consecutive_failures = 0;
    } else {
      e.consecutive_failures++;
      spdlog::warn("Health check failed for {} ({}/{})", name, e.consecutive_failures,
                   e.max_failures);
      if (e.consecutive_failures == e.max_failures) {
        errors_.handle_error(name, "HealthCheckFailure",
                             "health check failed " + std::to_string(e.consecutive_failures) +
                                 " consecutive times",
                             ErrorSeverity::HIGH);
      }
    }
    r.consecutive_failures = e.consecutive_failures;
    r.failed = e.consecutive_failures >= e.max_failures;

    any_unhealthy = any_unhealthy || !ok;
    any_failed = any_failed || r.failed;
    report.components.push_back(r);
  }

  if (any_failed) {
    report.overall = HealthStatus::CRITICAL;
  } else if (any_unhealthy) {
    report.overall = HealthStatus::DEGRADED;
  }
  report.system_degraded = errors_.is_system_degraded();

  last_ = report;
  return report;
}

SystemHealthReport HealthChecker::last_report() const {
  std::lock_guard<std::mutex> g(mu_);
  return last_;
}
