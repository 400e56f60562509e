#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "util.hpp"

// Thread-safe holder of the live AppConfig. Readers take a copy; writers go
// through update() so every change is validated and announced.
class ConfigManager {
public:
  using ChangeCallback = std::function<void(const AppConfig&)>;
  using Mutator = std::function<void(AppConfig&)>;

  explicit ConfigManager(AppConfig initial, std::string path = "");
  ~ConfigManager();

  ConfigManager(const ConfigManager&) = delete;
  ConfigManager& operator=(const ConfigManager&) = delete;

  AppConfig get() const;
  // Bumped on every accepted change; cheap staleness check for polling readers.
  uint64_t generation() const { return generation_.load(); }

  // Applies the mutator to a copy and commits it only if it validates. Writers are
  // serialized, so the mutator always sees the latest committed config.
  bool update(const Mutator& mutate);
  bool set_detection_sensitivity(const std::string& sensitivity);

  // Re-reads the file at path(); invalid or unreadable files keep the current config.
  bool reload();

  // Callbacks run on the writing thread after the write lock is released and may
  // call update() themselves.
  size_t add_change_callback(ChangeCallback cb);
  void remove_change_callback(size_t id);

  void start_watching(std::chrono::milliseconds interval = std::chrono::seconds(5));
  void stop_watching();
  bool watching() const { return watching_.load(); }

  const std::string& path() const { return path_; }

private:
  std::string path_;
  std::mutex write_mu_;
  mutable std::mutex mu_;
  AppConfig cfg_;
  std::atomic<uint64_t> generation_{0};

  std::mutex cb_mu_;
  std::vector<std::pair<size_t, ChangeCallback>> callbacks_;
  size_t next_callback_id_{1};

  std::atomic<bool> watching_{false};
  std::thread watch_thread_;
  std::mutex watch_mu_;
  std::condition_variable watch_cv_;
  std::filesystem::file_time_type last_mtime_{};

  void commit(const AppConfig& next);
  void notify(const AppConfig& cfg);
  bool file_mtime(std::filesystem::file_time_type& out) const;
};
