#include <brickfinder/vision/onnx_inference_backend.hpp>
#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/core/log.hpp>
#include "frame_cv_utils.hpp"
#include <onnxruntime_cxx_api.h>
#include <opencv2/imgproc.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace brickfinder::vision {

namespace nc = brickfinder::core;

namespace {

constexpr int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      nchw[0 * hw + y * w + x] = hwc[src_idx + 0];
      nchw[1 * hw + y * w + x] = hwc[src_idx + 1];
      nchw[2 * hw + y * w + x] = hwc[src_idx + 2];
    }
  }
}

std::uint32_t dim_or(int64_t dim, std::uint32_t fallback) {
  return dim > 0 ? static_cast<std::uint32_t>(dim) : fallback;
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "brickfinder"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::array<std::string, 3> output_names;
  std::vector<const char*> output_name_ptrs;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};
  /// Single output with [1, N, 6] or [1, 6, N] rows (YOLOv10 export).
  bool use_yolo_single_output{false};

  std::vector<float> nchw_buffer;
  cv::Mat resized;
  cv::Mat rgb_float;

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxInferenceBackend::OnnxInferenceBackend(const std::string& model_path,
                                           std::uint32_t fallback_width,
                                           std::uint32_t fallback_height)
    : impl_(std::make_unique<Impl>()) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  const std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("expected 4D image input");
  }
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = dim_or(dims[2], fallback_height);
    impl_->input_width = dim_or(dims[3], fallback_width);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = dim_or(dims[1], fallback_height);
    impl_->input_width = dim_or(dims[2], fallback_width);
  } else {
    throw std::runtime_error("expected input shape [1,3,H,W] or [1,H,W,3]");
  }
  if (impl_->input_width == 0 || impl_->input_height == 0) {
    throw std::runtime_error("model input has no usable spatial size");
  }

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs == 1u) {
    impl_->use_yolo_single_output = true;
    impl_->output_names[0] = impl_->session.GetOutputNameAllocated(0, allocator).get();
    impl_->output_name_ptrs.push_back(impl_->output_names[0].c_str());
  } else if (num_outputs >= 3u) {
    for (std::size_t i = 0; i < 3u; ++i) {
      impl_->output_names[i] = impl_->session.GetOutputNameAllocated(i, allocator).get();
      impl_->output_name_ptrs.push_back(impl_->output_names[i].c_str());
    }
  } else {
    throw std::runtime_error(
        "model must have 1 output (YOLO-style) or 3 outputs (boxes, scores, class_ids)");
  }

  BF_LOGI("onnx", "loaded %s: input %ux%u %s, %s output", model_path.c_str(),
          impl_->input_width, impl_->input_height, impl_->input_is_nchw ? "NCHW" : "NHWC",
          impl_->use_yolo_single_output ? "single" : "three-way");
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::uint32_t OnnxInferenceBackend::input_width() const noexcept { return impl_->input_width; }
std::uint32_t OnnxInferenceBackend::input_height() const noexcept { return impl_->input_height; }

std::expected<InferenceResult, nc::PipelineError> OnnxInferenceBackend::infer(
    const nc::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto bgr = detail::frame_to_bgr(input);
  if (!bgr) {
    return std::unexpected(nc::PipelineError::InvalidFrame);
  }

  const std::uint32_t h = impl_->input_height;
  const std::uint32_t w = impl_->input_width;
  cv::resize(*bgr, impl_->resized, cv::Size(static_cast<int>(w), static_cast<int>(h)));
  cv::cvtColor(impl_->resized, impl_->resized, cv::COLOR_BGR2RGB);
  impl_->resized.convertTo(impl_->rgb_float, CV_32FC3, 1.0 / 255.0);
  if (!impl_->rgb_float.isContinuous()) {
    impl_->rgb_float = impl_->rgb_float.clone();
  }
  float* src = impl_->rgb_float.ptr<float>();

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor{nullptr};
  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;

  if (impl_->input_is_nchw) {
    impl_->nchw_buffer.resize(num_floats);
    HwcToNchw(src, h, w, impl_->nchw_buffer.data());
    const std::array<int64_t, 4> shape{1, kNumChannels, static_cast<int64_t>(h),
                                       static_cast<int64_t>(w)};
    input_tensor = Ort::Value::CreateTensor<float>(mem_info, impl_->nchw_buffer.data(),
                                                   num_floats, shape.data(), shape.size());
  } else {
    const std::array<int64_t, 4> shape{1, static_cast<int64_t>(h), static_cast<int64_t>(w),
                                       kNumChannels};
    input_tensor =
        Ort::Value::CreateTensor<float>(mem_info, src, num_floats, shape.data(), shape.size());
  }

  const char* input_names_c[] = {impl_->input_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(),
                                 impl_->output_name_ptrs.size());
  } catch (const Ort::Exception& e) {
    BF_LOGW("onnx", "run failed: %s", e.what());
    return std::unexpected(nc::PipelineError::InferenceFailed);
  }

  // Model input coords -> frame pixel coords.
  const float sx = static_cast<float>(input.width()) / static_cast<float>(w);
  const float sy = static_cast<float>(input.height()) / static_cast<float>(h);
  InferenceResult result;
  auto push = [&](float x1, float y1, float x2, float y2, float score, int64_t cls) {
    result.add(x1 * sx, y1 * sy, x2 * sx, y2 * sy, score, cls);
  };

  if (impl_->use_yolo_single_output) {
    if (outputs.size() != 1u) {
      return std::unexpected(nc::PipelineError::InferenceFailed);
    }
    Ort::Value& out = outputs[0];
    const auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
    const float* data = out.GetTensorData<float>();
    int64_t n = 0;
    bool rows_are_n6 = false;  // true: [1, N, 6]; false: [1, 6, N]
    if (shape.size() == 3u && shape[0] == 1 && shape[2] == 6) {
      n = shape[1];
      rows_are_n6 = true;
    } else if (shape.size() == 3u && shape[0] == 1 && shape[1] == 6) {
      n = shape[2];
    }
    if (n < 0 || shape.size() != 3u) {
      return std::unexpected(nc::PipelineError::InferenceFailed);
    }
    for (int64_t i = 0; i < n; ++i) {
      if (rows_are_n6) {
        const float* row = data + i * 6;
        push(row[0], row[1], row[2], row[3], row[4], static_cast<int64_t>(row[5]));
      } else {
        push(data[0 * n + i], data[1 * n + i], data[2 * n + i], data[3 * n + i],
             data[4 * n + i], static_cast<int64_t>(data[5 * n + i]));
      }
    }
    return result;
  }

  if (outputs.size() < 3u) {
    return std::unexpected(nc::PipelineError::InferenceFailed);
  }
  const std::vector<int64_t> boxes_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();

  // [1, N, 4] or [N, 4].
  int64_t n = -1;
  if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[2] == 4) {
    n = boxes_shape[1];
  } else if (boxes_shape.size() == 2u && boxes_shape[1] == 4) {
    n = boxes_shape[0];
  }
  if (n < 0) {
    return std::unexpected(nc::PipelineError::InferenceFailed);
  }

  const float* boxes_data = outputs[0].GetTensorData<float>();
  const float* scores_data = outputs[1].GetTensorData<float>();
  const int64_t* classes_data = outputs[2].GetTensorData<int64_t>();
  for (int64_t i = 0; i < n; ++i) {
    const float* row = boxes_data + i * 4;
    push(row[0], row[1], row[2], row[3], scores_data[i], classes_data[i]);
  }
  return result;
}

void OnnxInferenceBackend::warmup() {
  std::vector<std::byte> buffer(
      static_cast<std::size_t>(impl_->input_height) * impl_->input_width * kNumChannels,
      std::byte{0});
  nc::Frame frame(impl_->input_width, impl_->input_height, nc::PixelFormat::BGR8,
                  std::move(buffer));
  auto r = infer(frame);
  if (!r) {
    BF_LOGW("onnx", "warmup run failed: %s", nc::to_string(r.error()).data());
  }
}

}  // namespace brickfinder::vision
