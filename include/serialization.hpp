#pragma once
#include <chrono>
#include <nlohmann/json.hpp>

#include "types.hpp"

// JSON forms used by the HTTP surface. Timestamps are milliseconds since epoch.

inline void to_json(nlohmann::json& j, const BoundingBox& b) {
  j = nlohmann::json{{"x", b.x}, {"y", b.y}, {"width", b.width}, {"height", b.height},
                     {"confidence", b.confidence}};
}

inline void from_json(const nlohmann::json& j, BoundingBox& b) {
  j.at("x").get_to(b.x);
  j.at("y").get_to(b.y);
  j.at("width").get_to(b.width);
  j.at("height").get_to(b.height);
  j.at("confidence").get_to(b.confidence);
}

inline void to_json(nlohmann::json& j, const Detection& d) {
  j = nlohmann::json{
      {"timestamp_ms",
       std::chrono::duration_cast<std::chrono::milliseconds>(d.timestamp.time_since_epoch())
           .count()},
      {"bounding_boxes", d.bounding_boxes},
      {"frame_width", d.frame_width},
      {"frame_height", d.frame_height},
      {"raw_confidence", d.raw_confidence}};
}

inline void from_json(const nlohmann::json& j, Detection& d) {
  d.timestamp = WallTime(std::chrono::milliseconds(j.at("timestamp_ms").get<int64_t>()));
  j.at("bounding_boxes").get_to(d.bounding_boxes);
  j.at("frame_width").get_to(d.frame_width);
  j.at("frame_height").get_to(d.frame_height);
  j.at("raw_confidence").get_to(d.raw_confidence);
}

inline void to_json(nlohmann::json& j, const ValidDetection& v) {
  to_json(j, static_cast<const Detection&>(v));
  j["cat_count"] = v.cat_count;
  j["is_on_counter"] = v.is_on_counter;
  j["validated_confidence"] = v.validated_confidence;
}

inline void from_json(const nlohmann::json& j, ValidDetection& v) {
  from_json(j, static_cast<Detection&>(v));
  j.at("cat_count").get_to(v.cat_count);
  j.at("is_on_counter").get_to(v.is_on_counter);
  j.at("validated_confidence").get_to(v.validated_confidence);
}
