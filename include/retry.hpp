#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <exception>
#include <functional>
#include <string>
#include <thread>

struct RetryPolicy {
  int max_attempts{3};
  double delay_s{1.0};
  double backoff_factor{1.0};

  // Sleep before retrying after failed attempt `attempt` (1-based).
  double delay_for(int attempt) const {
    return delay_s * std::pow(backoff_factor, static_cast<double>(attempt - 1));
  }
};

using SleepFn = std::function<void(std::chrono::duration<double>)>;

inline void default_sleep(std::chrono::duration<double> d) { std::this_thread::sleep_for(d); }

// Calls fn until it returns without throwing or attempts run out, then rethrows
// the last exception.
template <typename Fn>
auto retry_call(const RetryPolicy& policy, const std::string& op_name, Fn&& fn,
                const SleepFn& sleep = default_sleep) -> decltype(fn()) {
  std::exception_ptr last;
  const int attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    try {
      return fn();
    } catch (const std::exception& e) {
      last = std::current_exception();
      spdlog::warn("Attempt {}/{} failed for {}: {}", attempt, attempts, op_name, e.what());
      if (attempt < attempts) {
        const double wait = policy.delay_for(attempt);
        spdlog::debug("Retrying {} in {:.2f} seconds", op_name, wait);
        sleep(std::chrono::duration<double>(wait));
      }
    }
  }
  spdlog::error("All {} attempts failed for {}", attempts, op_name);
  std::rethrow_exception(last);
}
