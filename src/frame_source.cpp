#include "frame_source.hpp"

#include <spdlog/spdlog.h>

#include <cctype>

namespace {
bool is_device_index(const std::string& uri) {
  if (uri.empty()) return false;
  for (char c : uri) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}
}  // namespace

OpenCvFrameSource::OpenCvFrameSource(const InputConfig& cfg) : cfg_(cfg) {}

OpenCvFrameSource::~OpenCvFrameSource() { close(); }

bool OpenCvFrameSource::open() {
  std::lock_guard<std::mutex> g(mu_);
  if (cfg_.uri.empty()) return false;
  if (cap_.isOpened()) return true;

  bool ok = false;
  if (is_device_index(cfg_.uri)) {
    ok = cap_.open(std::stoi(cfg_.uri));
  } else {
    ok = cap_.open(cfg_.uri);
  }
  if (!ok) {
    spdlog::error("Failed to open input: {}", cfg_.uri);
    return false;
  }
  cap_.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  spdlog::info("Opened input '{}' ({}x{})", cfg_.uri, cfg_.width, cfg_.height);
  return true;
}

void OpenCvFrameSource::close() {
  std::lock_guard<std::mutex> g(mu_);
  if (cap_.isOpened()) {
    cap_.release();
    spdlog::info("Closed input '{}'", cfg_.uri);
  }
}

bool OpenCvFrameSource::is_open() const {
  std::lock_guard<std::mutex> g(mu_);
  return cap_.isOpened();
}

std::optional<cv::Mat> OpenCvFrameSource::grab() {
  std::lock_guard<std::mutex> g(mu_);
  if (!cap_.isOpened()) return std::nullopt;
  cv::Mat frame;
  if (!cap_.read(frame) || frame.empty()) return std::nullopt;
  return frame;
}

void OpenCvFrameSource::set_target_fps(double fps) {
  std::lock_guard<std::mutex> g(mu_);
  if (cap_.isOpened()) cap_.set(cv::CAP_PROP_FPS, fps);
}

std::unique_ptr<FrameSource> createFrameSource(const InputConfig& cfg) {
  return std::make_unique<OpenCvFrameSource>(cfg);
}
