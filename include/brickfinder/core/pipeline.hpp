#pragma once

#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace brickfinder::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of stages on one frame until a stage returns FrameDetections.
/// The last stage is normally a vision::DetectionStage wrapping the recognizer.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run on one frame. Returns the detections or the first stage error;
  /// InvalidConfig when no stage produced detections.
  /// Not reentrant: one inference pass at a time per pipeline.
  [[nodiscard]] std::expected<FrameDetections, PipelineError> run(
      const Frame& input,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept { return stages_.size(); }
  [[nodiscard]] bool empty() const noexcept { return stages_.empty(); }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace brickfinder::core
