#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "error_handler.hpp"
#include "types.hpp"

// Uniform health probe implemented by every long-lived component.
class HealthCheckable {
public:
  virtual ~HealthCheckable() = default;
  virtual std::string name() const = 0;
  virtual bool is_healthy() const = 0;
};

enum class HealthStatus { HEALTHY, DEGRADED, CRITICAL };

const char* to_string(HealthStatus s);

struct ComponentCheckResult {
  std::string name;
  bool healthy{true};
  int consecutive_failures{0};
  bool failed{false};  // reached max_failures
};

struct SystemHealthReport {
  WallTime timestamp{};
  HealthStatus overall{HealthStatus::HEALTHY};
  std::vector<ComponentCheckResult> components;
  bool system_degraded{false};
};

class HealthChecker {
public:
  explicit HealthChecker(ErrorHandler& errors) : errors_(errors) {}

  // The checkable must outlive the checker.
  void register_component(const HealthCheckable& component, int max_failures = 3);

  SystemHealthReport run_checks();
  SystemHealthReport last_report() const;

private:
  struct Entry {
    const HealthCheckable* component;
    int max_failures;
    int consecutive_failures{0};
  };

  ErrorHandler& errors_;
  mutable std::mutex mu_;
  std::vector<Entry> entries_;
  SystemHealthReport last_;
};
