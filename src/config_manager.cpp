#include "config_manager.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>

ConfigManager::ConfigManager(AppConfig initial, std::string path)
    : path_(std::move(path)), cfg_(std::move(initial)) {
  file_mtime(last_mtime_);
}

ConfigManager::~ConfigManager() { stop_watching(); }

AppConfig ConfigManager::get() const {
  std::lock_guard<std::mutex> g(mu_);
  return cfg_;
}

bool ConfigManager::update(const Mutator& mutate) {
  AppConfig next;
  {
    std::lock_guard<std::mutex> w(write_mu_);
    next = get();
    mutate(next);
    const auto problems = validate_config(next);
    if (!problems.empty()) {
      for (const auto& p : problems) spdlog::warn("Configuration update rejected: {}", p);
      return false;
    }
    commit(next);
  }
  notify(next);
  return true;
}

bool ConfigManager::set_detection_sensitivity(const std::string& sensitivity) {
  AppConfig scratch;
  if (!apply_sensitivity(scratch, sensitivity)) {
    spdlog::warn("Unknown detection sensitivity '{}'", sensitivity);
    return false;
  }
  const bool ok = update([&](AppConfig& c) { apply_sensitivity(c, sensitivity); });
  if (ok) spdlog::info("Detection sensitivity set to {}", sensitivity);
  return ok;
}

bool ConfigManager::reload() {
  if (path_.empty()) return false;
  AppConfig next;
  try {
    next = load_config(path_);
  } catch (const YAML::Exception& e) {
    spdlog::error("Config reload failed for {}: {}", path_, e.what());
    return false;
  }
  const auto problems = validate_config(next);
  if (!problems.empty()) {
    for (const auto& p : problems) spdlog::error("Reloaded config invalid: {}", p);
    return false;
  }
  {
    std::lock_guard<std::mutex> w(write_mu_);
    commit(next);
  }
  spdlog::info("Configuration reloaded from {}", path_);
  notify(next);
  return true;
}

size_t ConfigManager::add_change_callback(ChangeCallback cb) {
  std::lock_guard<std::mutex> g(cb_mu_);
  const size_t id = next_callback_id_++;
  callbacks_.emplace_back(id, std::move(cb));
  return id;
}

void ConfigManager::remove_change_callback(size_t id) {
  std::lock_guard<std::mutex> g(cb_mu_);
  callbacks_.erase(std::remove_if(callbacks_.begin(), callbacks_.end(),
                                  [id](const auto& e) { return e.first == id; }),
                   callbacks_.end());
}

// Caller holds write_mu_.
void ConfigManager::commit(const AppConfig& next) {
  std::lock_guard<std::mutex> g(mu_);
  cfg_ = next;
  generation_.fetch_add(1);
}

void ConfigManager::notify(const AppConfig& cfg) {
  std::vector<ChangeCallback> cbs;
  {
    std::lock_guard<std::mutex> g(cb_mu_);
    for (const auto& e : callbacks_) cbs.push_back(e.second);
  }
  for (auto& cb : cbs) {
    try {
      cb(cfg);
    } catch (const std::exception& e) {
      spdlog::error("Config change callback failed: {}", e.what());
    }
  }
}

bool ConfigManager::file_mtime(std::filesystem::file_time_type& out) const {
  if (path_.empty()) return false;
  std::error_code ec;
  auto t = std::filesystem::last_write_time(path_, ec);
  if (ec) return false;
  out = t;
  return true;
}

void ConfigManager::start_watching(std::chrono::milliseconds interval) {
  if (path_.empty()) {
    spdlog::warn("No config file to watch");
    return;
  }
  if (watching_.exchange(true)) return;
  watch_thread_ = std::thread([this, interval] {
    spdlog::info("Watching {} for changes every {} ms", path_, interval.count());
    while (watching_) {
      {
        std::unique_lock<std::mutex> lk(watch_mu_);
        watch_cv_.wait_for(lk, interval, [this] { return !watching_.load(); });
      }
      if (!watching_) break;
      std::filesystem::file_time_type t;
      if (file_mtime(t) && t != last_mtime_) {
        last_mtime_ = t;
        spdlog::info("Config file {} changed", path_);
        reload();
      }
    }
  });
}

void ConfigManager::stop_watching() {
  {
    std::lock_guard<std::mutex> lk(watch_mu_);
    if (!watching_.exchange(false)) return;
  }
  watch_cv_.notify_all();
  if (watch_thread_.joinable()) watch_thread_.join();
}
