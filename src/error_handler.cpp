#include "error_handler.hpp"

#include <cxxabi.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <typeinfo>

using namespace std::chrono;

const char* to_string(ErrorSeverity s) {
  switch (s) {
    case ErrorSeverity::LOW:
      return "low";
    case ErrorSeverity::MEDIUM:
      return "medium";
    case ErrorSeverity::HIGH:
      return "high";
    case ErrorSeverity::CRITICAL:
      return "critical";
  }
  return "unknown";
}

const char* to_string(ComponentStatus s) {
  switch (s) {
    case ComponentStatus::HEALTHY:
      return "healthy";
    case ComponentStatus::DEGRADED:
      return "degraded";
    case ComponentStatus::FAILED:
      return "failed";
    case ComponentStatus::RECOVERING:
      return "recovering";
  }
  return "unknown";
}

std::string exception_type_name(const std::exception& e) {
  const char* mangled = typeid(e).name();
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> demangled(
      abi::__cxa_demangle(mangled, nullptr, nullptr, &status), std::free);
  return (status == 0 && demangled) ? std::string(demangled.get()) : std::string(mangled);
}

ErrorHandler::ErrorHandler(size_t max_error_history) : max_error_history_(max_error_history) {}

void ErrorHandler::register_component(const std::string& component, int max_recovery_attempts) {
  {
    std::lock_guard<std::mutex> g(mu_);
    ComponentHealth h;
    h.name = component;
    h.max_recovery_attempts = max_recovery_attempts;
    components_[component] = h;
  }
  spdlog::debug("Registered component for monitoring: {}", component);
}

void ErrorHandler::register_recovery_strategy(const std::string& error_type,
                                              RecoveryStrategy strategy) {
  std::lock_guard<std::mutex> g(mu_);
  strategies_[error_type] = std::move(strategy);
}

void ErrorHandler::register_recovery_callback(const std::string& component, RecoveryCallback cb) {
  std::lock_guard<std::mutex> g(mu_);
  recovery_callbacks_[component].push_back(std::move(cb));
}

bool ErrorHandler::handle_error(const std::string& component, const std::exception& error,
                                ErrorSeverity severity, const std::string& context) {
  return handle_error(component, exception_type_name(error), error.what(), severity, context);
}

bool ErrorHandler::handle_error(const std::string& component, const std::string& error_type,
                                const std::string& message, ErrorSeverity severity,
                                const std::string& context) {
  ErrorRecord rec;
  rec.timestamp = WallClock::now();
  rec.component = component;
  rec.error_type = error_type;
  rec.message = message;
  rec.severity = severity;

  log_error(rec, context);

  RecoveryStrategy strategy;
  {
    std::lock_guard<std::mutex> g(mu_);
    update_component_health_locked(rec);

    // Collapse repeats of the same error inside a minute into one record.
    bool merged = false;
    for (auto& existing : history_) {
      if (existing.component == rec.component && existing.error_type == rec.error_type &&
          existing.message == rec.message && rec.timestamp - existing.timestamp < seconds(60)) {
        existing.occurrence_count++;
        existing.timestamp = rec.timestamp;
        merged = true;
        break;
      }
    }
    if (!merged) {
      history_.push_back(rec);
      while (history_.size() > max_error_history_) history_.pop_front();
    }

    const std::string key = component + ":" + error_type;
    int n = ++patterns_[key];
    if (n > 5) {
      spdlog::warn("Recurring error pattern detected: {} ({} occurrences)", key, n);
    }

    auto it = strategies_.find(error_type);
    if (it != strategies_.end()) {
      auto& health = components_[component];
      if (!health.can_recover()) {
        spdlog::warn("Component {} has exceeded max recovery attempts", component);
        return false;
      }
      health.recovery_attempts++;
      health.status = ComponentStatus::RECOVERING;
      strategy = it->second;
    }
  }

  if (!strategy) return false;

  bool success = false;
  try {
    spdlog::info("Attempting recovery for {} in {}", error_type, component);
    success = strategy(rec);
  } catch (const std::exception& e) {
    spdlog::error("Recovery strategy for {} threw: {}", error_type, e.what());
    success = false;
  }

  std::lock_guard<std::mutex> g(mu_);
  auto& health = components_[component];
  if (health.last_error) {
    health.last_error->recovery_attempted = true;
    health.last_error->recovery_successful = success;
  }
  if (success) {
    health.status = ComponentStatus::HEALTHY;
    health.recovery_attempts = 0;
    spdlog::info("Recovery successful for {} in {}", error_type, component);
  } else {
    health.status = health.can_recover() ? ComponentStatus::DEGRADED : ComponentStatus::FAILED;
    spdlog::warn("Recovery failed for {} in {}", error_type, component);
  }
  return success;
}

void ErrorHandler::mark_component_healthy(const std::string& component) {
  std::lock_guard<std::mutex> g(mu_);
  auto it = components_.find(component);
  if (it == components_.end()) return;
  it->second.status = ComponentStatus::HEALTHY;
  it->second.recovery_attempts = 0;
}

void ErrorHandler::log_error(const ErrorRecord& rec, const std::string& context) const {
  std::string msg = fmt::format("[{}] {}: {}", rec.component, rec.error_type, rec.message);
  if (!context.empty()) msg += " | Context: " + context;

  switch (rec.severity) {
    case ErrorSeverity::CRITICAL:
      spdlog::critical(msg);
      break;
    case ErrorSeverity::HIGH:
      spdlog::error(msg);
      break;
    case ErrorSeverity::MEDIUM:
      spdlog::warn(msg);
      break;
    case ErrorSeverity::LOW:
      spdlog::info(msg);
      break;
  }
}

void ErrorHandler::update_component_health_locked(const ErrorRecord& rec) {
  auto it = components_.find(rec.component);
  if (it == components_.end()) {
    ComponentHealth h;
    h.name = rec.component;
    it = components_.emplace(rec.component, h).first;
  }
  auto& health = it->second;
  health.last_error = rec;
  health.error_count++;

  if (rec.severity == ErrorSeverity::CRITICAL) {
    health.status = ComponentStatus::FAILED;
  } else if (rec.severity == ErrorSeverity::HIGH || health.error_count > 5) {
    health.status = ComponentStatus::DEGRADED;
  } else if (health.status == ComponentStatus::HEALTHY) {
    health.status = ComponentStatus::DEGRADED;
  }
}

void ErrorHandler::trigger_graceful_degradation(const std::string& reason) {
  std::lock_guard<std::mutex> g(mu_);
  if (system_degraded_) return;
  system_degraded_ = true;
  degradation_start_ = WallClock::now();
  spdlog::warn("System entering degraded mode: {}", reason);
}

bool ErrorHandler::recover_from_degradation() {
  std::vector<std::pair<std::string, RecoveryCallback>> to_fire;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (!system_degraded_) return true;

    for (const auto& [name, health] : components_) {
      if (health.status == ComponentStatus::FAILED) return false;
    }
    system_degraded_ = false;
    degradation_start_.reset();
    for (const auto& [name, cbs] : recovery_callbacks_) {
      for (const auto& cb : cbs) to_fire.emplace_back(name, cb);
    }
  }
  spdlog::info("System recovered from degraded mode");

  for (auto& [name, cb] : to_fire) {
    try {
      cb();
    } catch (const std::exception& e) {
      spdlog::error("Error in recovery callback for {}: {}", name, e.what());
    }
  }
  return true;
}

bool ErrorHandler::is_system_degraded() const {
  std::lock_guard<std::mutex> g(mu_);
  return system_degraded_;
}

std::optional<ComponentHealth> ErrorHandler::component_health(const std::string& component) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = components_.find(component);
  if (it == components_.end()) return std::nullopt;
  return it->second;
}

std::vector<ComponentHealth> ErrorHandler::all_component_health() const {
  std::lock_guard<std::mutex> g(mu_);
  std::vector<ComponentHealth> out;
  out.reserve(components_.size());
  for (const auto& [name, h] : components_) out.push_back(h);
  return out;
}

std::vector<ErrorRecord> ErrorHandler::recent_errors(size_t count) const {
  std::lock_guard<std::mutex> g(mu_);
  const size_t n = std::min(count, history_.size());
  return std::vector<ErrorRecord>(history_.end() - static_cast<std::ptrdiff_t>(n), history_.end());
}

ErrorStatistics ErrorHandler::error_statistics() const {
  std::lock_guard<std::mutex> g(mu_);
  ErrorStatistics st;
  const auto cutoff = WallClock::now() - hours(1);
  for (const auto& rec : history_) {
    st.total_errors += static_cast<size_t>(rec.occurrence_count);
    st.by_severity[rec.severity] += static_cast<size_t>(rec.occurrence_count);
    if (rec.timestamp >= cutoff) st.errors_last_hour += static_cast<size_t>(rec.occurrence_count);
  }
  st.top_patterns.assign(patterns_.begin(), patterns_.end());
  std::stable_sort(st.top_patterns.begin(), st.top_patterns.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });
  if (st.top_patterns.size() > 5) st.top_patterns.resize(5);
  return st;
}
