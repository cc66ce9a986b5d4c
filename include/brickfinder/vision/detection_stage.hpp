#pragma once

#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/core/pipeline_stage.hpp>
#include <brickfinder/vision/candidate_decoder.hpp>
#include <brickfinder/vision/inference_backend.hpp>
#include <expected>
#include <memory>

namespace brickfinder::vision {

/// Terminal pipeline stage: run the recognizer + decoder -> FrameDetections.
/// Holds a shared reference to the backend; the model itself is owned by the
/// ModelHandle kept on the control thread.
class DetectionStage : public brickfinder::core::IPipelineStage {
 public:
  DetectionStage(std::shared_ptr<IInferenceBackend> backend, CandidateDecoder decoder);

  /// Convenience: backend and labels taken from a loaded model.
  explicit DetectionStage(const ModelHandle& model);

  [[nodiscard]] std::expected<brickfinder::core::StageOutput, brickfinder::core::PipelineError>
  process(const brickfinder::core::Frame& input) override;

 private:
  std::shared_ptr<IInferenceBackend> backend_;
  CandidateDecoder decoder_;
};

}  // namespace brickfinder::vision
