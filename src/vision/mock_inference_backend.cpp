#include <brickfinder/vision/mock_inference_backend.hpp>
#include <brickfinder/core/error.hpp>
#include <algorithm>
#include <thread>
#include <vector>

namespace brickfinder::vision {

void MockInferenceBackend::set_detections(std::vector<MockDetection> detections) {
  std::lock_guard lock(mutex_);
  script_.clear();
  script_.push_back(std::move(detections));
  cursor_ = 0;
}

void MockInferenceBackend::set_script(std::vector<std::vector<MockDetection>> script) {
  std::lock_guard lock(mutex_);
  script_ = std::move(script);
  cursor_ = 0;
}

void MockInferenceBackend::set_latency(std::chrono::milliseconds latency) {
  std::lock_guard lock(mutex_);
  latency_ = latency;
}

void MockInferenceBackend::fail_next(std::size_t count) {
  std::lock_guard lock(mutex_);
  failures_pending_ = count;
}

std::vector<std::uint64_t> MockInferenceBackend::inferred_seqs() const {
  std::lock_guard lock(mutex_);
  return seqs_;
}

static InferenceResult mock_to_result(const std::vector<MockDetection>& detections) {
  InferenceResult r;
  for (const auto& d : detections) {
    r.add(d.bbox.x, d.bbox.y, d.bbox.x + d.bbox.w, d.bbox.y + d.bbox.h, d.confidence,
          d.class_id);
  }
  return r;
}

std::expected<InferenceResult, brickfinder::core::PipelineError> MockInferenceBackend::infer(
    const brickfinder::core::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  std::chrono::milliseconds latency{0};
  InferenceResult result;
  bool fail = false;
  {
    std::lock_guard lock(mutex_);
    seqs_.push_back(input.seq());
    latency = latency_;
    if (failures_pending_ > 0) {
      --failures_pending_;
      fail = true;
    } else if (!script_.empty()) {
      const std::size_t idx = std::min(cursor_, script_.size() - 1);
      result = mock_to_result(script_[idx]);
      ++cursor_;
    }
  }
  ++infer_calls_;
  if (latency.count() > 0) std::this_thread::sleep_for(latency);
  if (fail) return std::unexpected(brickfinder::core::PipelineError::InferenceFailed);
  return result;
}

}  // namespace brickfinder::vision
