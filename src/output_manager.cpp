#include "output_manager.hpp"

#include <spdlog/fmt/fmt.h>

#include <ctime>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>

namespace fs = std::filesystem;

namespace {
std::string iso_timestamp(WallTime t) {
  std::time_t tt = WallClock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count() % 1000;
  return fmt::format("{}.{:03d}", buf, ms);
}
}  // namespace

OutputManager::OutputManager(const StorageConfig& config, int performance_summary_interval_s)
    : config_(config), performance_summary_interval_s_(performance_summary_interval_s) {
  stats_.reset();
}

OutputManager::~OutputManager() { cleanup(); }

std::string OutputManager::images_dir() const {
  std::lock_guard<std::mutex> g(mu_);
  return (fs::path(config_.data_dir) / "images").string();
}

std::string OutputManager::csv_path() const {
  std::lock_guard<std::mutex> g(mu_);
  return (fs::path(config_.data_dir) / "detections.csv").string();
}

bool OutputManager::initialize() {
  std::error_code ec;
  fs::create_directories(images_dir(), ec);
  if (ec) {
    spdlog::error("Failed to create output directory {}: {}", images_dir(), ec.message());
    return false;
  }
  initializeCSV();

  std::lock_guard<std::mutex> g(mu_);
  if (!csv_file_.is_open()) return false;
  spdlog::info("Output manager writing to {} (quality {}, keep {} days)", config_.data_dir,
               config_.image_quality, config_.max_storage_days);
  return true;
}

void OutputManager::cleanup() {
  closeCSV();
  logPerformanceSummary(true);
}

void OutputManager::initializeCSV() {
  const std::string path = csv_path();
  const bool existed = fs::exists(path);

  std::lock_guard<std::mutex> g(mu_);
  csv_file_.open(path, std::ios::out | std::ios::app);
  if (!csv_file_.is_open()) {
    spdlog::error("Failed to open CSV file for writing: {}", path);
    return;
  }
  if (!existed) {
    csv_file_ << "timestamp,cat_count,confidence,image_path,boxes\n";
    csv_file_.flush();
  }
  spdlog::info("CSV logging initialized: {}", path);
}

void OutputManager::closeCSV() {
  std::lock_guard<std::mutex> g(mu_);
  if (csv_file_.is_open()) {
    csv_file_.close();
    spdlog::info("CSV logging completed");
  }
}

std::string OutputManager::format_boxes(const std::vector<BoundingBox>& boxes) {
  std::string out;
  for (size_t i = 0; i < boxes.size(); ++i) {
    if (i) out += ';';
    out += fmt::format("{}:{}:{}:{}", boxes[i].x, boxes[i].y, boxes[i].width, boxes[i].height);
  }
  return out;
}

std::string OutputManager::image_path_for(WallTime t) const {
  std::time_t tt = WallClock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count() % 1000;
  return (fs::path(images_dir()) / fmt::format("cat_{}_{:03d}.jpg", buf, ms)).string();
}

std::string OutputManager::save_detection(const ValidDetection& detection, const cv::Mat& frame) {
  std::string path = image_path_for(detection.timestamp);
  int quality = 85;
  {
    std::lock_guard<std::mutex> g(mu_);
    quality = config_.image_quality;
  }

  bool written = false;
  if (!frame.empty()) {
    try {
      written = cv::imwrite(path, frame, {cv::IMWRITE_JPEG_QUALITY, quality});
    } catch (const cv::Exception& e) {
      spdlog::error("Image encode failed for {}: {}", path, e.what());
    }
  }
  if (!written) {
    spdlog::error("Failed to save detection image {}", path);
    path.clear();
  }

  writeCSVRow(detection, path);

  std::lock_guard<std::mutex> g(mu_);
  stats_.total_detections++;
  stats_.total_cats += static_cast<uint64_t>(detection.cat_count);
  stats_.total_confidence += detection.validated_confidence;
  if (written) {
    stats_.images_saved++;
    consecutive_failures_ = 0;
  } else {
    stats_.save_failures++;
    consecutive_failures_++;
  }
  return path;
}

void OutputManager::writeCSVRow(const ValidDetection& detection, const std::string& image_path) {
  std::lock_guard<std::mutex> g(mu_);
  if (!csv_file_.is_open()) return;
  csv_file_ << iso_timestamp(detection.timestamp) << ',' << detection.cat_count << ','
            << fmt::format("{:.3f}", detection.validated_confidence) << ',' << image_path << ",\""
            << format_boxes(detection.bounding_boxes) << "\"\n";
  csv_file_.flush();
}

void OutputManager::record_frame() {
  std::lock_guard<std::mutex> g(mu_);
  stats_.total_frames++;
}

size_t OutputManager::cleanup_old_data() {
  int days = 30;
  bool enabled = true;
  {
    std::lock_guard<std::mutex> g(mu_);
    days = config_.max_storage_days;
    enabled = config_.auto_cleanup;
  }
  if (!enabled) return 0;

  const auto cutoff = fs::file_time_type::clock::now() - std::chrono::hours(24 * days);
  size_t removed = 0;
  std::error_code ec;
  for (fs::directory_iterator it(images_dir(), ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    std::error_code tec;
    const auto mtime = fs::last_write_time(it->path(), tec);
    if (tec || mtime >= cutoff) continue;
    if (fs::remove(it->path(), tec)) removed++;
    if (tec) spdlog::warn("Could not remove {}: {}", it->path().string(), tec.message());
  }
  if (ec) spdlog::warn("Storage cleanup stopped early: {}", ec.message());
  if (removed) spdlog::info("Removed {} images older than {} days", removed, days);
  return removed;
}

void OutputManager::logPerformanceSummary(bool force) {
  std::lock_guard<std::mutex> g(mu_);
  auto now = std::chrono::steady_clock::now();
  auto duration = std::chrono::duration_cast<std::chrono::seconds>(now - stats_.last_summary);

  if (!force && duration.count() < performance_summary_interval_s_) {
    return;
  }

  spdlog::info("=== DETECTION SUMMARY ===");
  spdlog::info("Frames processed: {}", stats_.total_frames);
  spdlog::info("Average FPS: {:.2f}", stats_.getFPS());
  spdlog::info("Detections saved: {} ({} cats)", stats_.total_detections, stats_.total_cats);
  spdlog::info("Average confidence: {:.2f}", stats_.getAvgConfidence());
  spdlog::info("Image save failure rate: {:.1f}%", stats_.getFailureRate());

  stats_.last_summary = now;
}

PerformanceStats OutputManager::stats() const {
  std::lock_guard<std::mutex> g(mu_);
  return stats_;
}

void OutputManager::set_config(const StorageConfig& config) {
  std::lock_guard<std::mutex> g(mu_);
  config_ = config;
}

bool OutputManager::is_healthy() const {
  std::lock_guard<std::mutex> g(mu_);
  return csv_file_.is_open() && consecutive_failures_ < 3;
}
