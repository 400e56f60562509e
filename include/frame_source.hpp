#pragma once

#include <memory>
#include <mutex>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <optional>
#include <string>

#include "util.hpp"

class FrameSource {
public:
  virtual ~FrameSource() = default;
  virtual bool open() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;
  // Empty when no frame is available (end of stream or read failure).
  virtual std::optional<cv::Mat> grab() = 0;
  virtual void set_target_fps(double fps) = 0;
};

// cv::VideoCapture over a webcam index ("0") or a file/stream URI.
class OpenCvFrameSource : public FrameSource {
public:
  explicit OpenCvFrameSource(const InputConfig& cfg);
  ~OpenCvFrameSource() override;

  bool open() override;
  void close() override;
  bool is_open() const override;
  std::optional<cv::Mat> grab() override;
  void set_target_fps(double fps) override;

private:
  InputConfig cfg_;
  mutable std::mutex mu_;
  cv::VideoCapture cap_;
};

std::unique_ptr<FrameSource> createFrameSource(const InputConfig& cfg);
