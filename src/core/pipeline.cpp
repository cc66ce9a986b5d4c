#include <brickfinder/core/pipeline.hpp>
#include <chrono>
#include <optional>
#include <utility>

namespace brickfinder::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<FrameDetections, PipelineError> Pipeline::run(const Frame& input,
                                                            StageTimingCallback* timing_cb) {
  // Stages that pass a frame through hand back a new Frame; the caller's frame
  // is only read, so it can still be used by the candidate filter afterwards.
  std::optional<Frame> owned;
  const Frame* current = &input;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(*current);
    if (timing_cb) {
      const auto elapsed = std::chrono::steady_clock::now() - stage_start;
      (*timing_cb)(i, std::chrono::duration<double, std::milli>(elapsed).count());
    }

    if (!result) {
      return std::unexpected(result.error());
    }
    if (auto* detections = std::get_if<FrameDetections>(&*result)) {
      detections->seq = input.seq();
      detections->captured_at = input.captured_at();
      return std::move(*detections);
    }
    owned = std::move(std::get<Frame>(*result));
    current = &*owned;
  }
  return std::unexpected(PipelineError::InvalidConfig);
}

}  // namespace brickfinder::core
