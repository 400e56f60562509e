#include "metrics.hpp"
#include <sstream>

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.frame_p50 = frame_.perc(50);   s.frame_p95 = frame_.perc(95);   s.frame_p99 = frame_.perc(99);
  s.detect_p50 = detect_.perc(50); s.detect_p95 = detect_.perc(95); s.detect_p99 = detect_.perc(99);
  s.frames_total = frames_total_.load();
  s.frames_skipped = frames_skipped_.load();
  s.raw_detections_total = raw_total_.load();
  s.valid_detections_total = valid_total_.load();
  s.cats_counted_total = cats_total_.load();
  s.notifications_total = notifications_total_.load();
  s.errors_total = errors_total_.load();
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "frame_processing_ms{quantile=\"0.5\"} "  << s.frame_p50 << "\n";
  os << "frame_processing_ms{quantile=\"0.95\"} " << s.frame_p95 << "\n";
  os << "frame_processing_ms{quantile=\"0.99\"} " << s.frame_p99 << "\n";

  os << "detection_ms{quantile=\"0.5\"} "  << s.detect_p50 << "\n";
  os << "detection_ms{quantile=\"0.95\"} " << s.detect_p95 << "\n";
  os << "detection_ms{quantile=\"0.99\"} " << s.detect_p99 << "\n";

  os << "frames_total " << s.frames_total << "\n";
  os << "frames_skipped_total " << s.frames_skipped << "\n";
  os << "raw_detections_total " << s.raw_detections_total << "\n";
  os << "valid_detections_total " << s.valid_detections_total << "\n";
  os << "cats_counted_total " << s.cats_counted_total << "\n";
  os << "notifications_sent_total " << s.notifications_total << "\n";
  os << "pipeline_errors_total " << s.errors_total << "\n";

  os << "pipeline_fps " << s.fps << "\n";
  os << "optimization_level " << s.optimization_level << "\n";
  return os.str();
}
