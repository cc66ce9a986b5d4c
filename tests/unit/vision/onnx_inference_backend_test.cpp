// Unit tests for OnnxInferenceBackend.
// The missing-file test needs no model. The rest need a real detection .onnx:
// set BRICKFINDER_TEST_ONNX_MODEL to its path. They are skipped otherwise.
#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/vision/onnx_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace nv = brickfinder::vision;
namespace nc = brickfinder::core;

static std::string get_test_model_path() {
  const char* env = std::getenv("BRICKFINDER_TEST_ONNX_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static nc::Frame make_bgr_frame(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buffer(nc::Frame::min_bytes(w, h, nc::PixelFormat::BGR8),
                                std::byte{0});
  return nc::Frame(w, h, nc::PixelFormat::BGR8, std::move(buffer));
}

TEST(OnnxInferenceBackend, ConstructorThrowsWhenFileMissing) {
  EXPECT_THROW(
      { nv::OnnxInferenceBackend backend("nonexistent_brick_model_12345.onnx"); },
      Ort::Exception);
}

TEST(OnnxInferenceBackend, InferRejectsEmptyFrame) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set BRICKFINDER_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxInferenceBackend backend(path);
  auto result = backend.infer(nc::Frame{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::PipelineError::InvalidFrame);
}

TEST(OnnxInferenceBackend, InferAcceptsAnyFrameSize) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set BRICKFINDER_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxInferenceBackend backend(path);
  EXPECT_GT(backend.input_width(), 0u);
  EXPECT_GT(backend.input_height(), 0u);
  backend.warmup();

  auto result = backend.infer(make_bgr_frame(320, 240));
  ASSERT_TRUE(result.has_value()) << "infer() should succeed with a captured-size frame";
  EXPECT_EQ(result->boxes.size(), result->num_detections * 4u);
  EXPECT_EQ(result->scores.size(), result->num_detections);
  EXPECT_EQ(result->class_ids.size(), result->num_detections);
  for (std::uint32_t i = 0; i < result->num_detections; ++i) {
    EXPECT_GE(result->scores[i], 0.f);
    EXPECT_LE(result->scores[i], 1.f);
  }
}

TEST(OnnxInferenceBackend, WarmupDoesNotThrow) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set BRICKFINDER_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxInferenceBackend backend(path);
  EXPECT_NO_THROW(backend.warmup());
}
