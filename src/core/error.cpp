#include <brickfinder/core/error.hpp>

namespace brickfinder::core {

std::string_view to_string(PipelineError e) noexcept {
  switch (e) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::LoadFailed:
      return "LoadFailed";
    case PipelineError::InferenceFailed:
      return "InferenceFailed";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::DecoderError:
      return "DecoderError";
    case PipelineError::NotReady:
      return "NotReady";
    case PipelineError::CaptureFault:
      return "CaptureFault";
  }
  return "Unknown";
}

std::string_view to_string(LoadErrorCode c) noexcept {
  switch (c) {
    case LoadErrorCode::FileNotFound:
      return "FileNotFound";
    case LoadErrorCode::UnsupportedFormat:
      return "UnsupportedFormat";
    case LoadErrorCode::InitFailed:
      return "InitFailed";
  }
  return "Unknown";
}

}  // namespace brickfinder::core
