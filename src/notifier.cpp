#include "notifier.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>

void LogNotificationChannel::send(const Notification& n) {
  if (n.image_path.empty()) {
    spdlog::warn("[notify] {}", n.message);
  } else {
    spdlog::warn("[notify] {} ({})", n.message, n.image_path);
  }
}

const char* to_string(NotifyResult r) {
  switch (r) {
    case NotifyResult::SENT:
      return "sent";
    case NotifyResult::DISABLED:
      return "disabled";
    case NotifyResult::QUIET_HOURS:
      return "quiet_hours";
    case NotifyResult::COOLDOWN:
      return "cooldown";
    case NotifyResult::RATE_LIMITED:
      return "rate_limited";
    case NotifyResult::FAILED:
      return "failed";
  }
  return "unknown";
}

Notifier::Notifier(const NotificationConfig& cfg, ErrorHandler& errors, RetryPolicy policy,
                   NowFn now, SleepFn sleep)
    : cfg_(cfg), errors_(errors), policy_(policy), now_(std::move(now)), sleep_(std::move(sleep)) {
  errors_.register_component(name());
}

void Notifier::add_channel(std::unique_ptr<NotificationChannel> channel) {
  std::lock_guard<std::mutex> g(mu_);
  spdlog::info("Notification channel registered: {}", channel->name());
  channels_.push_back(std::move(channel));
}

std::string Notifier::format_message(const ValidDetection& d) {
  const char* word = d.cat_count == 1 ? "cat" : "cats";
  return fmt::format("Alert! {} {} detected on kitchen counter at {} (confidence: {:.1f}%)",
                     d.cat_count, word, format_time_hms(d.timestamp),
                     static_cast<double>(d.validated_confidence) * 100.0);
}

std::string Notifier::format_subject(const ValidDetection& d) {
  const char* word = d.cat_count == 1 ? "cat" : "cats";
  return fmt::format("Cat Counter Alert - {} {} detected", d.cat_count, word);
}

void Notifier::set_config(const NotificationConfig& cfg) {
  std::lock_guard<std::mutex> g(mu_);
  cfg_ = cfg;
}

bool Notifier::channel_enabled(const NotificationChannel& ch) const {
  return ch.kind() == ChannelKind::PUSH ? cfg_.push_enabled : cfg_.email_enabled;
}

void Notifier::prune_recent(WallTime now) {
  while (!recent_sends_.empty() && now - recent_sends_.front() >= std::chrono::hours(1))
    recent_sends_.pop_front();
}

NotifyResult Notifier::notify(const ValidDetection& detection, const std::string& image_path) {
  const WallTime now = now_();
  {
    std::lock_guard<std::mutex> g(mu_);
    if (!cfg_.push_enabled && !cfg_.email_enabled) {
      stats_.suppressed_disabled++;
      return NotifyResult::DISABLED;
    }

    std::time_t tt = WallClock::to_time_t(now);
    std::tm tm{};
    localtime_r(&tt, &tm);
    if (is_quiet_hour(cfg_, tm.tm_hour)) {
      stats_.suppressed_quiet++;
      spdlog::debug("Notification suppressed during quiet hours");
      return NotifyResult::QUIET_HOURS;
    }

    if (stats_.last_sent && now - *stats_.last_sent < std::chrono::minutes(cfg_.cooldown_minutes)) {
      stats_.suppressed_cooldown++;
      spdlog::debug("Notification skipped due to cooldown");
      return NotifyResult::COOLDOWN;
    }

    prune_recent(now);
    if (recent_sends_.size() >= static_cast<size_t>(cfg_.max_per_hour)) {
      stats_.suppressed_rate++;
      spdlog::info("Notification rate limit reached ({} per hour)", cfg_.max_per_hour);
      return NotifyResult::RATE_LIMITED;
    }
  }

  Notification n{format_subject(detection), format_message(detection), image_path, now};
  return deliver(n);
}

NotifyResult Notifier::send_test_notification() {
  Notification n{"Cat Counter Test", "Test notification from cat counter", "", now_()};
  return deliver(n);
}

// Channels are sent to outside mu_; retries can sleep for seconds.
NotifyResult Notifier::deliver(const Notification& n) {
  std::vector<std::shared_ptr<NotificationChannel>> targets;
  {
    std::lock_guard<std::mutex> g(mu_);
    for (const auto& ch : channels_) {
      if (channel_enabled(*ch)) targets.push_back(ch);
    }
    if (targets.empty()) {
      stats_.suppressed_disabled++;
      return NotifyResult::DISABLED;
    }
  }

  bool any_ok = false;
  for (auto& ch : targets) {
    try {
      retry_call(policy_, "notify via " + ch->name(), [&] { ch->send(n); }, sleep_);
      any_ok = true;
    } catch (const std::exception& e) {
      errors_.handle_error(name(), e, ErrorSeverity::MEDIUM, "channel " + ch->name());
    }
  }

  std::lock_guard<std::mutex> g(mu_);
  if (!any_ok) {
    stats_.failed++;
    consecutive_failures_++;
    return NotifyResult::FAILED;
  }

  stats_.sent++;
  stats_.last_sent = n.timestamp;
  recent_sends_.push_back(n.timestamp);
  consecutive_failures_ = 0;
  return NotifyResult::SENT;
}

NotifierStats Notifier::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  NotifierStats s = stats_;
  const WallTime now = now_();
  s.sent_last_hour = 0;
  for (const auto& t : recent_sends_) {
    if (now - t < std::chrono::hours(1)) s.sent_last_hour++;
  }
  return s;
}

bool Notifier::is_healthy() const {
  std::lock_guard<std::mutex> g(mu_);
  return consecutive_failures_ < 3;
}
