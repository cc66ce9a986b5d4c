#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace brickfinder::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  InferenceFailed,
  InvalidConfig,
  DecoderError,
  NotReady,
  CaptureFault,
};

/// Why a model load failed. Always recoverable: the state machine moves to
/// ERROR and retry is a first-class transition.
enum class LoadErrorCode : std::uint8_t {
  FileNotFound,
  UnsupportedFormat,
  InitFailed,
};

struct LoadError {
  LoadErrorCode code{LoadErrorCode::InitFailed};
  std::string reason;  // human readable, shown by the presentation layer
};

/// Out-of-range QualityConfig field. The rejected snapshot never becomes active.
struct FilterConfigError {
  std::string field;
  std::string reason;
};

/// Capture source disconnected or returned an unusable frame.
/// Not a pipeline error: inference consumption pauses, DetectionState is untouched.
struct CaptureFault {
  std::string reason;
};

[[nodiscard]] std::string_view to_string(PipelineError e) noexcept;
[[nodiscard]] std::string_view to_string(LoadErrorCode c) noexcept;

}  // namespace brickfinder::core
