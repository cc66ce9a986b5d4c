#pragma once

#include <brickfinder/core/candidate.hpp>
#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <cstdint>
#include <expected>
#include <variant>

namespace brickfinder::core {

/// Unfiltered recognizer output for one frame.
struct FrameDetections {
  std::uint64_t seq{0};
  Timestamp captured_at{};
  CandidateList candidates;
};

/// Output of a pipeline stage: either pass-through Frame or final FrameDetections.
using StageOutput = std::variant<Frame, FrameDetections>;

/// Abstract pipeline stage: process one Frame, return Frame (continue) or
/// FrameDetections (done).
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  [[nodiscard]] virtual std::expected<StageOutput, PipelineError> process(
      const Frame& input) = 0;
};

}  // namespace brickfinder::core
