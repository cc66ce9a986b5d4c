#include <brickfinder/core/frame.hpp>
#include <brickfinder/vision/capture_source.hpp>
#include <brickfinder/vision/load_image.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <string>
#include <vector>

namespace nv = brickfinder::vision;
namespace nc = brickfinder::core;

TEST(StillImageSource, ReplaysTheSameFrameWithFreshTimestamps) {
  std::vector<std::byte> buf(8 * 4 * 3, std::byte{7});
  nv::StillImageSource source(nc::Frame(8, 4, nc::PixelFormat::BGR8, std::move(buf)));
  EXPECT_EQ(source.name(), "still");

  auto first = source.read();
  auto second = source.read();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->width(), 8u);
  EXPECT_EQ(first->height(), 4u);
  EXPECT_EQ(first->size_bytes(), second->size_bytes());
  EXPECT_NE(first->captured_at(), nc::Timestamp{});
  EXPECT_LE(first->captured_at(), second->captured_at());
  EXPECT_TRUE(source.reopen().has_value());
}

TEST(StillImageSource, EmptyFrameIsAFault) {
  nv::StillImageSource source{nc::Frame{}};
  auto r = source.read();
  ASSERT_FALSE(r.has_value());
  EXPECT_FALSE(r.error().reason.empty());
}

TEST(CaptureSource, MissingImageFileIsAFault) {
  auto r = nv::open_capture_source("/nonexistent/brickfinder/parts.png");
  ASSERT_FALSE(r.has_value());
  EXPECT_NE(r.error().reason.find("parts.png"), std::string::npos);
}

TEST(CaptureSource, UnopenableVideoIsAFault) {
  auto r = nv::open_capture_source("/nonexistent/brickfinder/table.mp4");
  EXPECT_FALSE(r.has_value());
}

TEST(LoadImage, MissingFileReturnsNullopt) {
  EXPECT_FALSE(nv::load_frame_from_image("/nonexistent/brickfinder/parts.png").has_value());
}
