#include <brickfinder/vision/detection_stage.hpp>
#include <brickfinder/core/log.hpp>

namespace brickfinder::vision {

namespace nc = brickfinder::core;

DetectionStage::DetectionStage(std::shared_ptr<IInferenceBackend> backend,
                               CandidateDecoder decoder)
    : backend_(std::move(backend)), decoder_(std::move(decoder)) {}

DetectionStage::DetectionStage(const ModelHandle& model)
    : DetectionStage(model.backend, CandidateDecoder(model.labels)) {}

std::expected<nc::StageOutput, nc::PipelineError> DetectionStage::process(
    const nc::Frame& input) {
  if (!backend_) {
    return std::unexpected(nc::PipelineError::NotReady);
  }
  auto result = backend_->infer(input);
  if (!result) {
    BF_LOGW("detect", "%s inference failed on frame %llu: %s", backend_->name().data(),
            static_cast<unsigned long long>(input.seq()), nc::to_string(result.error()).data());
    return std::unexpected(result.error());
  }

  nc::FrameDetections out;
  out.seq = input.seq();
  out.captured_at = input.captured_at();
  out.candidates = decoder_.decode(*result, input.captured_at());
  return nc::StageOutput{std::move(out)};
}

}  // namespace brickfinder::vision
