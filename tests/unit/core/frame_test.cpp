#include <brickfinder/core/candidate.hpp>
#include <brickfinder/core/frame.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace nc = brickfinder::core;

TEST(Frame, DefaultEmpty) {
  nc::Frame f;
  EXPECT_EQ(f.width(), 0u);
  EXPECT_EQ(f.height(), 0u);
  EXPECT_TRUE(f.empty());
  EXPECT_EQ(f.size_bytes(), 0u);
  EXPECT_FALSE(f.is_valid());
}

TEST(Frame, ConstructFromBuffer) {
  std::vector<std::byte> buf(100 * 100 * 3);
  nc::Frame f(100, 100, nc::PixelFormat::BGR8, std::move(buf), 7);
  EXPECT_EQ(f.width(), 100u);
  EXPECT_EQ(f.height(), 100u);
  EXPECT_EQ(f.format(), nc::PixelFormat::BGR8);
  EXPECT_EQ(f.seq(), 7u);
  EXPECT_FALSE(f.empty());
  EXPECT_EQ(f.data().size(), 100u * 100 * 3);
  EXPECT_TRUE(f.is_valid());
}

TEST(Frame, MinBytes) {
  EXPECT_EQ(nc::Frame::min_bytes(10, 10, nc::PixelFormat::Grayscale8), 100u);
  EXPECT_EQ(nc::Frame::min_bytes(10, 10, nc::PixelFormat::RGB8), 300u);
  EXPECT_EQ(nc::Frame::min_bytes(10, 10, nc::PixelFormat::BGRA8), 400u);
  EXPECT_EQ(nc::Frame::min_bytes(10, 10, nc::PixelFormat::Unknown), 0u);
}

TEST(Frame, ShortBufferIsInvalid) {
  std::vector<std::byte> buf(10);
  nc::Frame f(10, 10, nc::PixelFormat::RGB8, std::move(buf));
  EXPECT_FALSE(f.is_valid());
}

TEST(BBox, IouOfIdenticalBoxesIsOne) {
  nc::BBox a{10.f, 10.f, 20.f, 20.f};
  EXPECT_FLOAT_EQ(nc::iou(a, a), 1.f);
}

TEST(BBox, IouOfDisjointBoxesIsZero) {
  EXPECT_FLOAT_EQ(nc::iou({0, 0, 10, 10}, {20, 20, 10, 10}), 0.f);
}

TEST(BBox, IouOfHalfOverlap) {
  // Intersection 50, union 150.
  EXPECT_NEAR(nc::iou({0, 0, 10, 10}, {5, 0, 10, 10}), 1.f / 3.f, 1e-6f);
}
