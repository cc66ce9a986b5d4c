#include <brickfinder/vision/candidate_decoder.hpp>
#include <brickfinder/core/log.hpp>
#include <cmath>
#include <cstddef>

namespace brickfinder::vision {

namespace nc = brickfinder::core;

CandidateDecoder::CandidateDecoder(ClassLabels labels) : labels_(std::move(labels)) {}

nc::CandidateList CandidateDecoder::decode(const InferenceResult& result,
                                           nc::Timestamp timestamp) const {
  nc::CandidateList out;
  const std::size_t n = static_cast<std::size_t>(result.num_detections);
  out.reserve(n);

  std::size_t skipped = 0;
  for (std::size_t i = 0; i < n; ++i) {
    if (i >= result.scores.size() || i >= result.class_ids.size() ||
        i * 4 + 3 >= result.boxes.size()) {
      ++skipped;
      continue;
    }
    const auto cid = result.class_ids[i];
    if (cid < 0 || static_cast<std::size_t>(cid) >= labels_.size() ||
        labels_[static_cast<std::size_t>(cid)].empty()) {
      ++skipped;
      continue;
    }
    const float score = result.scores[i];
    if (!std::isfinite(score)) {
      ++skipped;
      continue;
    }

    nc::Candidate c;
    c.key = labels_[static_cast<std::size_t>(cid)];
    c.confidence = score;
    c.timestamp = timestamp;
    c.bbox.x = result.boxes[i * 4 + 0];
    c.bbox.y = result.boxes[i * 4 + 1];
    c.bbox.w = result.boxes[i * 4 + 2] - c.bbox.x;
    c.bbox.h = result.boxes[i * 4 + 3] - c.bbox.y;
    out.push_back(std::move(c));
  }
  if (skipped > 0) {
    BF_LOGD("decoder", "skipped %zu rows without a usable label", skipped);
  }
  return out;
}

}  // namespace brickfinder::vision
