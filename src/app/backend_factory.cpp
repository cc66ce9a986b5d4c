#include <brickfinder/app/backend_factory.hpp>
#include <brickfinder/core/log.hpp>
#include <brickfinder/vision/contour_inference_backend.hpp>
#include <brickfinder/vision/mock_inference_backend.hpp>
#ifdef BRICKFINDER_HAS_ONNXRUNTIME
#include <brickfinder/vision/onnx_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#endif
#include <filesystem>
#include <memory>
#include <system_error>

namespace brickfinder::app {

namespace {

LoadResult fail(core::LoadErrorCode code, std::string reason) {
  return std::unexpected(core::LoadError{code, std::move(reason)});
}

LoadResult make_mock(const PipelineConfig& config) {
  vision::ModelHandle handle;
  handle.backend = std::make_shared<vision::MockInferenceBackend>();
  handle.labels = config.labels;
  return handle;
}

LoadResult make_contour(const LoadRequest& request) {
  if (request.color_targets.empty()) {
    return fail(core::LoadErrorCode::InitFailed,
                "contour backend needs at least one inventory item with a known colour");
  }
  auto backend = std::make_shared<vision::ContourInferenceBackend>(request.color_targets);
  vision::ModelHandle handle;
  handle.labels = backend->labels();
  handle.backend = std::move(backend);
  return handle;
}

LoadResult make_onnx(const PipelineConfig& config, const LoadRequest& request) {
  namespace fs = std::filesystem;
  std::error_code ec;
  if (request.model_path.empty() || !fs::is_regular_file(request.model_path, ec)) {
    return fail(core::LoadErrorCode::FileNotFound,
                "model file not found: '" + request.model_path + "'");
  }
#ifdef BRICKFINDER_HAS_ONNXRUNTIME
  if (config.labels.empty()) {
    BF_LOGW("factory", "no labels configured; every detection will be dropped");
  }
  try {
    vision::ModelHandle handle;
    handle.backend = std::make_shared<vision::OnnxInferenceBackend>(
        request.model_path, config.input_width, config.input_height);
    handle.labels = config.labels;
    return handle;
  } catch (const Ort::Exception& e) {
    return fail(core::LoadErrorCode::UnsupportedFormat,
                "cannot open '" + request.model_path + "': " + e.what());
  } catch (const std::exception& e) {
    return fail(core::LoadErrorCode::UnsupportedFormat,
                "incompatible model '" + request.model_path + "': " + e.what());
  }
#else
  (void)config;
  return fail(core::LoadErrorCode::UnsupportedFormat,
              "built without ONNX Runtime; cannot load '" + request.model_path + "'");
#endif
}

}  // namespace

BackendFactory make_backend_factory(const PipelineConfig& config) {
  return [config](const LoadRequest& request) -> LoadResult {
    switch (config.backend_type) {
      case InferenceBackendType::Mock:
        return make_mock(config);
      case InferenceBackendType::Contour:
        return make_contour(request);
      case InferenceBackendType::Onnx:
        return make_onnx(config, request);
    }
    return fail(core::LoadErrorCode::InitFailed, "unknown backend type");
  };
}

}  // namespace brickfinder::app
