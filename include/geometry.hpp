#pragma once
#include "types.hpp"

// IoU above this marks two detections as the same cat, both for same-frame
// dedup and for cross-frame tracking.
constexpr double kNmsIouThreshold = 0.3;
constexpr double kTemporalIouThreshold = 0.3;

// Axis-aligned intersection-over-union. 0 when the boxes only touch or the union is empty.
double iou(const BoundingBox& a, const BoundingBox& b);

// Boundary-inclusive point-in-ROI test.
bool point_in_roi(int px, int py, const Roi& roi);

bool center_in_roi(const BoundingBox& box, const Roi& roi);

// Primary-box IoU of two detections; 0 if either has no boxes.
double primary_iou(const Detection& a, const Detection& b);

bool detections_similar(const Detection& a, const Detection& b, double threshold);

// Keeps `fraction` of the ROI's width/height, centered on the original.
Roi shrink_roi(const Roi& roi, double fraction);
