#pragma once

#include <brickfinder/core/frame.hpp>
#include <string>
#include <vector>

namespace brickfinder::core {

/// Axis-aligned bounding box in pixel coordinates of the captured frame.
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};

  [[nodiscard]] float area() const noexcept { return w > 0.f && h > 0.f ? w * h : 0.f; }

  friend bool operator==(const BBox&, const BBox&) = default;
};

/// Intersection over union; 0 when either box is empty.
[[nodiscard]] float iou(const BBox& a, const BBox& b) noexcept;

/// One recognizer output for one inventory item. Produced and consumed within
/// a single pipeline pass; never persisted.
struct Candidate {
  std::string key;  // identity key of the inventory item
  BBox bbox{};
  float confidence{0.f};
  Timestamp timestamp{};

  friend bool operator==(const Candidate&, const Candidate&) = default;
};

using CandidateList = std::vector<Candidate>;

}  // namespace brickfinder::core
