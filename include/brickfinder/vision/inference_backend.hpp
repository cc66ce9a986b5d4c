#pragma once

#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/vision/inference_result.hpp>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace brickfinder::vision {

/// Abstract recognizer: Frame -> InferenceResult. The pipeline treats it as
/// opaque; a neural model and a classical heuristic are equally valid.
/// Implement infer(); optionally override validate_input and warmup.
/// infer() is responsible for calling validate_input() on its frame.
/// Instances are used by one inference worker at a time.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  /// Single-frame inference. Must be implemented.
  [[nodiscard]] virtual std::expected<InferenceResult, brickfinder::core::PipelineError>
  infer(const brickfinder::core::Frame& input) = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept
  /// any frame whose buffer matches its declared geometry.
  [[nodiscard]] virtual std::expected<void, brickfinder::core::PipelineError>
  validate_input(const brickfinder::core::Frame& input) const;

  /// Optional: warmup run (e.g. dummy inference). Called once by the model
  /// loader, on the load worker. Default: no-op.
  virtual void warmup() {}
};

/// A loaded recognizer plus the identity key of every class id it emits.
/// Shared between the control thread (which holds it for the process lifetime)
/// and the inference worker.
struct ModelHandle {
  std::shared_ptr<IInferenceBackend> backend;
  std::vector<std::string> labels;

  [[nodiscard]] explicit operator bool() const noexcept { return backend != nullptr; }
};

}  // namespace brickfinder::vision
