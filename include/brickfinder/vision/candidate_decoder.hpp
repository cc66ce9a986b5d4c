#pragma once

#include <brickfinder/core/candidate.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/vision/inference_result.hpp>
#include <string>
#include <vector>

namespace brickfinder::vision {

/// Maps model class id to identity key (index = class id).
using ClassLabels = std::vector<std::string>;

/// Decodes InferenceResult -> Candidates. Class ids without a label and
/// malformed rows are skipped. No quality gating here; that is
/// filter_candidates()'s job.
class CandidateDecoder {
 public:
  explicit CandidateDecoder(ClassLabels labels);

  [[nodiscard]] brickfinder::core::CandidateList decode(
      const InferenceResult& result,
      brickfinder::core::Timestamp timestamp = {}) const;

  [[nodiscard]] const ClassLabels& labels() const noexcept { return labels_; }

 private:
  ClassLabels labels_;
};

}  // namespace brickfinder::vision
