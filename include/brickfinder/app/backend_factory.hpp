#pragma once

#include <brickfinder/app/config.hpp>
#include <brickfinder/app/model_loader.hpp>

namespace brickfinder::app {

/// Factory for the configured recognizer:
/// - mock:    MockInferenceBackend with `config.labels` (no detections until scripted)
/// - onnx:    OnnxInferenceBackend on LoadRequest::model_path, labels from config
///            (FileNotFound / UnsupportedFormat / InitFailed on failure;
///            UnsupportedFormat when built without ONNX Runtime)
/// - contour: ContourInferenceBackend over LoadRequest::color_targets
[[nodiscard]] BackendFactory make_backend_factory(const PipelineConfig& config);

}  // namespace brickfinder::app
