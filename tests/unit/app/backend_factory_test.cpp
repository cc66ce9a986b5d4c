#include <brickfinder/app/backend_factory.hpp>
#include <brickfinder/app/config.hpp>
#include <brickfinder/core/error.hpp>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace nba = brickfinder::app;
namespace nc = brickfinder::core;
namespace nv = brickfinder::vision;

TEST(BackendFactory, MockUsesConfiguredLabels) {
  auto cfg = nba::default_config();
  cfg.backend_type = nba::InferenceBackendType::Mock;
  cfg.labels = {"3001", "3003"};
  auto result = nba::make_backend_factory(cfg)(nba::LoadRequest{});
  ASSERT_TRUE(result.has_value());
  ASSERT_NE(result->backend, nullptr);
  EXPECT_EQ(result->backend->name(), "mock");
  EXPECT_EQ(result->labels, (std::vector<std::string>{"3001", "3003"}));
}

TEST(BackendFactory, ContourLabelsFollowColourTargets) {
  auto cfg = nba::default_config();
  cfg.backend_type = nba::InferenceBackendType::Contour;
  nba::LoadRequest request;
  request.color_targets = {{"3001", {255, 0, 0}}, {"3004", {0, 0, 255}}};
  auto result = nba::make_backend_factory(cfg)(request);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->backend->name(), "contour");
  EXPECT_EQ(result->labels, (std::vector<std::string>{"3001", "3004"}));
}

TEST(BackendFactory, ContourWithoutColoursFailsInit) {
  auto cfg = nba::default_config();
  cfg.backend_type = nba::InferenceBackendType::Contour;
  auto result = nba::make_backend_factory(cfg)(nba::LoadRequest{});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, nc::LoadErrorCode::InitFailed);
}

TEST(BackendFactory, OnnxMissingModelIsFileNotFound) {
  auto cfg = nba::default_config();
  cfg.backend_type = nba::InferenceBackendType::Onnx;
  nba::LoadRequest request;
  request.model_path = "/nonexistent/brickfinder/bricks.onnx";
  auto result = nba::make_backend_factory(cfg)(request);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, nc::LoadErrorCode::FileNotFound);
  EXPECT_NE(result.error().reason.find("bricks.onnx"), std::string::npos);
}
