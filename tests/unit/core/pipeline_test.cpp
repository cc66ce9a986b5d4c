#include <brickfinder/core/frame.hpp>
#include <brickfinder/core/pipeline.hpp>
#include <brickfinder/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace nc = brickfinder::core;

namespace {

class PassThroughStage : public nc::IPipelineStage {
 public:
  std::expected<nc::StageOutput, nc::PipelineError> process(
      const nc::Frame& input) override {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return nc::StageOutput{nc::Frame(input.width(), input.height(),
                                     input.format(), std::move(buf))};
  }
};

class EmitCandidateStage : public nc::IPipelineStage {
 public:
  std::expected<nc::StageOutput, nc::PipelineError> process(
      const nc::Frame&) override {
    nc::FrameDetections d;
    d.candidates.push_back({"3001", {1, 1, 10, 10}, 0.9f, {}});
    return nc::StageOutput{std::move(d)};
  }
};

class FailingStage : public nc::IPipelineStage {
 public:
  std::expected<nc::StageOutput, nc::PipelineError> process(
      const nc::Frame&) override {
    return std::unexpected(nc::PipelineError::InferenceFailed);
  }
};

nc::Frame tiny(std::uint64_t seq = 0) {
  std::vector<std::byte> buf(10);
  return nc::Frame(1, 1, nc::PixelFormat::Grayscale8, std::move(buf), seq);
}

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsError) {
  nc::Pipeline p;
  EXPECT_TRUE(p.empty());
  auto result = p.run(tiny());
  EXPECT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::PipelineError::InvalidConfig);
}

TEST(Pipeline, SingleStageEmitsDetections) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<EmitCandidateStage>());
  auto result = p.run(tiny(42));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->seq, 42u);
  ASSERT_EQ(result->candidates.size(), 1u);
  EXPECT_EQ(result->candidates[0].key, "3001");
  EXPECT_FLOAT_EQ(result->candidates[0].confidence, 0.9f);
}

TEST(Pipeline, PassThroughThenEmit) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<EmitCandidateStage>());
  EXPECT_EQ(p.stage_count(), 2u);
  auto result = p.run(tiny(5));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->seq, 5u);
  EXPECT_EQ(result->candidates.size(), 1u);
}

TEST(Pipeline, PassThroughOnlyIsInvalidConfig) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  auto result = p.run(tiny());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::PipelineError::InvalidConfig);
}

TEST(Pipeline, StageErrorStopsRun) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<FailingStage>());
  p.add_stage(std::make_unique<EmitCandidateStage>());
  auto result = p.run(tiny());
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), nc::PipelineError::InferenceFailed);
}

TEST(Pipeline, NullStageIgnored) {
  nc::Pipeline p;
  p.add_stage(nullptr);
  EXPECT_TRUE(p.empty());
}

TEST(Pipeline, TimingCallbackSeesEveryStage) {
  nc::Pipeline p;
  p.add_stage(std::make_unique<PassThroughStage>());
  p.add_stage(std::make_unique<EmitCandidateStage>());
  std::vector<std::size_t> seen;
  nc::StageTimingCallback cb = [&seen](std::size_t index, double ms) {
    EXPECT_GE(ms, 0.0);
    seen.push_back(index);
  };
  ASSERT_TRUE(p.run(tiny(), &cb).has_value());
  EXPECT_EQ(seen, (std::vector<std::size_t>{0, 1}));
}
