#pragma once

#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

enum class ErrorSeverity { LOW, MEDIUM, HIGH, CRITICAL };

enum class ComponentStatus { HEALTHY, DEGRADED, FAILED, RECOVERING };

const char* to_string(ErrorSeverity s);
const char* to_string(ComponentStatus s);

struct ErrorRecord {
  WallTime timestamp{};
  std::string component;
  std::string error_type;
  std::string message;
  ErrorSeverity severity{ErrorSeverity::MEDIUM};
  bool recovery_attempted{false};
  bool recovery_successful{false};
  int occurrence_count{1};
};

struct ComponentHealth {
  std::string name;
  ComponentStatus status{ComponentStatus::HEALTHY};
  std::optional<ErrorRecord> last_error;
  int error_count{0};
  int recovery_attempts{0};
  int max_recovery_attempts{3};

  bool is_healthy() const { return status == ComponentStatus::HEALTHY; }
  bool can_recover() const { return recovery_attempts < max_recovery_attempts; }
};

struct ErrorStatistics {
  size_t total_errors{0};
  size_t errors_last_hour{0};
  std::map<ErrorSeverity, size_t> by_severity;
  std::vector<std::pair<std::string, int>> top_patterns;  // "component:type" -> count
};

// Central error sink shared by every component. One instance per process, passed by
// reference into constructors.
class ErrorHandler {
public:
  using RecoveryStrategy = std::function<bool(const ErrorRecord&)>;
  using RecoveryCallback = std::function<void()>;

  explicit ErrorHandler(size_t max_error_history = 1000);

  void register_component(const std::string& component, int max_recovery_attempts = 3);
  void register_recovery_strategy(const std::string& error_type, RecoveryStrategy strategy);
  void register_recovery_callback(const std::string& component, RecoveryCallback cb);

  // Logs, records and, when a strategy is registered for the error type, attempts
  // recovery. Returns true iff recovery ran and succeeded.
  bool handle_error(const std::string& component, const std::exception& error,
                    ErrorSeverity severity = ErrorSeverity::MEDIUM,
                    const std::string& context = "");
  bool handle_error(const std::string& component, const std::string& error_type,
                    const std::string& message, ErrorSeverity severity = ErrorSeverity::MEDIUM,
                    const std::string& context = "");

  void mark_component_healthy(const std::string& component);

  void trigger_graceful_degradation(const std::string& reason);
  bool recover_from_degradation();
  bool is_system_degraded() const;

  std::optional<ComponentHealth> component_health(const std::string& component) const;
  std::vector<ComponentHealth> all_component_health() const;
  std::vector<ErrorRecord> recent_errors(size_t count) const;
  ErrorStatistics error_statistics() const;

private:
  size_t max_error_history_;
  mutable std::mutex mu_;
  std::deque<ErrorRecord> history_;
  std::map<std::string, ComponentHealth> components_;
  std::map<std::string, RecoveryStrategy> strategies_;
  std::map<std::string, std::vector<RecoveryCallback>> recovery_callbacks_;
  std::map<std::string, int> patterns_;

  bool system_degraded_{false};
  std::optional<WallTime> degradation_start_;

  void log_error(const ErrorRecord& rec, const std::string& context) const;
  void update_component_health_locked(const ErrorRecord& rec);
};

// Demangled dynamic type name of an exception, used as the error_type key.
std::string exception_type_name(const std::exception& e);
