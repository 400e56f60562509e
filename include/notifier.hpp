#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "error_handler.hpp"
#include "health.hpp"
#include "retry.hpp"
#include "types.hpp"
#include "util.hpp"

struct Notification {
  std::string subject;
  std::string message;
  std::string image_path;
  WallTime timestamp{};
};

enum class ChannelKind { PUSH, EMAIL };

// Delivery transport. send() throws on failure so the notifier can retry.
class NotificationChannel {
public:
  virtual ~NotificationChannel() = default;
  virtual std::string name() const = 0;
  virtual ChannelKind kind() const = 0;
  virtual void send(const Notification& n) = 0;
};

// Writes alerts to the application log. Always available as the push channel.
class LogNotificationChannel : public NotificationChannel {
public:
  std::string name() const override { return "log"; }
  ChannelKind kind() const override { return ChannelKind::PUSH; }
  void send(const Notification& n) override;
};

enum class NotifyResult { SENT, DISABLED, QUIET_HOURS, COOLDOWN, RATE_LIMITED, FAILED };

const char* to_string(NotifyResult r);

struct NotifierStats {
  uint64_t sent{0};
  uint64_t suppressed_disabled{0};
  uint64_t suppressed_quiet{0};
  uint64_t suppressed_cooldown{0};
  uint64_t suppressed_rate{0};
  uint64_t failed{0};
  size_t sent_last_hour{0};
  std::optional<WallTime> last_sent;
};

class Notifier : public HealthCheckable {
public:
  using NowFn = std::function<WallTime()>;

  Notifier(const NotificationConfig& cfg, ErrorHandler& errors, RetryPolicy policy = RetryPolicy{},
           NowFn now = [] { return WallClock::now(); }, SleepFn sleep = default_sleep);

  void add_channel(std::unique_ptr<NotificationChannel> channel);

  NotifyResult notify(const ValidDetection& detection, const std::string& image_path);
  // Bypasses cooldown, rate limit and quiet hours.
  NotifyResult send_test_notification();

  static std::string format_message(const ValidDetection& detection);
  static std::string format_subject(const ValidDetection& detection);

  void set_config(const NotificationConfig& cfg);
  NotifierStats stats() const;

  std::string name() const override { return "notifier"; }
  bool is_healthy() const override;

private:
  NotificationConfig cfg_;
  ErrorHandler& errors_;
  RetryPolicy policy_;
  NowFn now_;
  SleepFn sleep_;

  mutable std::mutex mu_;
  std::vector<std::shared_ptr<NotificationChannel>> channels_;
  std::deque<WallTime> recent_sends_;
  NotifierStats stats_;
  int consecutive_failures_{0};

  bool channel_enabled(const NotificationChannel& ch) const;
  NotifyResult deliver(const Notification& n);
  void prune_recent(WallTime now);
};
