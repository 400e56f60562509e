#include "geometry.hpp"

#include <algorithm>

double iou(const BoundingBox& a, const BoundingBox& b) {
  const int64_t x1 = std::max(a.x, b.x);
  const int64_t y1 = std::max(a.y, b.y);
  const int64_t x2 = std::min<int64_t>(static_cast<int64_t>(a.x) + a.width,
                                       static_cast<int64_t>(b.x) + b.width);
  const int64_t y2 = std::min<int64_t>(static_cast<int64_t>(a.y) + a.height,
                                       static_cast<int64_t>(b.y) + b.height);

  if (x2 <= x1 || y2 <= y1) return 0.0;

  const int64_t inter = (x2 - x1) * (y2 - y1);
  const int64_t uni = a.area() + b.area() - inter;
  return uni > 0 ? static_cast<double>(inter) / static_cast<double>(uni) : 0.0;
}

bool point_in_roi(int px, int py, const Roi& roi) {
  return roi.x <= px && px <= roi.x + roi.width && roi.y <= py && py <= roi.y + roi.height;
}

bool center_in_roi(const BoundingBox& box, const Roi& roi) {
  return point_in_roi(box.center_x(), box.center_y(), roi);
}

double primary_iou(const Detection& a, const Detection& b) {
  if (a.bounding_boxes.empty() || b.bounding_boxes.empty()) return 0.0;
  return iou(a.bounding_boxes.front(), b.bounding_boxes.front());
}

bool detections_similar(const Detection& a, const Detection& b, double threshold) {
  return primary_iou(a, b) > threshold;
}

Roi shrink_roi(const Roi& roi, double fraction) {
  if (fraction >= 1.0 || fraction <= 0.0) return roi;
  Roi out;
  out.width = static_cast<int>(roi.width * fraction);
  out.height = static_cast<int>(roi.height * fraction);
  out.x = roi.x + (roi.width - out.width) / 2;
  out.y = roi.y + (roi.height - out.height) / 2;
  return out;
}
