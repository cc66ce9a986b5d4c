#include <brickfinder/vision/inference_backend.hpp>
#include <brickfinder/core/error.hpp>

namespace brickfinder::vision {

std::expected<void, brickfinder::core::PipelineError> IInferenceBackend::validate_input(
    const brickfinder::core::Frame& input) const {
  if (!input.is_valid()) {
    return std::unexpected(brickfinder::core::PipelineError::InvalidFrame);
  }
  return {};
}

}  // namespace brickfinder::vision
