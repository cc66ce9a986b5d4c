#pragma once

#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/vision/inference_backend.hpp>
#include <brickfinder/vision/inference_result.hpp>
#include <cstdint>
#include <memory>
#include <string>

#ifdef BRICKFINDER_HAS_ONNXRUNTIME

namespace brickfinder::vision {

/// ONNX Runtime recognizer: loads a detection model and implements IInferenceBackend.
///
/// Expected model: one float image input ([1,3,H,W] or [1,H,W,3], RGB, 0..1)
/// and either
/// - **one output (YOLO-style)**: [1, N, 6] or [1, 6, N] with
///   (xmin, ymin, xmax, ymax, score, class_id) per row, or
/// - **three outputs**: boxes [1,N,4], scores [1,N], class_ids [1,N].
///
/// Unlike a preprocessed tensor pipeline, infer() accepts captured frames of any
/// size and 8-bit format: the frame is resized to the model input, converted to
/// RGB float and transposed to NCHW when needed. Boxes are scaled back to frame
/// pixel coordinates.
///
/// The constructor throws (Ort::Exception or std::runtime_error) when the file
/// cannot be opened or its inputs/outputs do not match; the model loader turns
/// that into a LoadError.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param fallback_width,fallback_height Used when the model input has
  ///        dynamic spatial dimensions.
  explicit OnnxInferenceBackend(const std::string& model_path,
                                std::uint32_t fallback_width = 640,
                                std::uint32_t fallback_height = 640);

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::string_view name() const noexcept override { return "onnx"; }

  [[nodiscard]] std::expected<InferenceResult, brickfinder::core::PipelineError> infer(
      const brickfinder::core::Frame& input) override;

  void warmup() override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace brickfinder::vision

#endif  // BRICKFINDER_HAS_ONNXRUNTIME
