#pragma once

#include <cstdint>
#include <vector>

namespace brickfinder::vision {

/// Raw recognizer output (boxes, class scores, class ids) before it is mapped
/// to identity keys and filtered.
struct InferenceResult {
  std::vector<float> boxes;  // [x1,y1,x2,y2] per detection, frame pixel coords
  std::vector<float> scores;
  std::vector<std::int64_t> class_ids;
  std::uint32_t num_detections{0};

  void add(float x1, float y1, float x2, float y2, float score, std::int64_t class_id) {
    boxes.insert(boxes.end(), {x1, y1, x2, y2});
    scores.push_back(score);
    class_ids.push_back(class_id);
    ++num_detections;
  }
};

}  // namespace brickfinder::vision
