#include <brickfinder/core/candidate.hpp>
#include <brickfinder/core/inventory.hpp>
#include <brickfinder/core/quality_config.hpp>
#include <brickfinder/vision/candidate_filter.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <random>
#include <vector>

namespace nv = brickfinder::vision;
namespace nc = brickfinder::core;

namespace {

nc::Candidate cand(const char* key, nc::BBox box, float confidence) {
  return {key, box, confidence, {}};
}

nc::InventoryView view_of(std::initializer_list<const char*> known,
                          std::initializer_list<const char*> excluded = {}) {
  nc::InventoryView v;
  for (const char* k : known) v.known.insert(k);
  for (const char* k : excluded) v.excluded.insert(k);
  return v;
}

/// BGR frame, black, with one red square at (20, 20, 40).
nc::Frame red_square_frame() {
  constexpr std::uint32_t kSize = 100;
  std::vector<std::byte> buf(kSize * kSize * 3, std::byte{0});
  for (std::uint32_t y = 20; y < 60; ++y) {
    for (std::uint32_t x = 20; x < 60; ++x) {
      buf[(y * kSize + x) * 3 + 2] = std::byte{255};
    }
  }
  return nc::Frame(kSize, kSize, nc::PixelFormat::BGR8, std::move(buf));
}

}  // namespace

TEST(CandidateFilter, ConfidenceThreshold) {
  nc::QualityConfig cfg;
  cfg.confidence = 0.5f;
  auto out = nv::filter_candidates(
      {cand("A", {0, 0, 20, 20}, 0.49f), cand("B", {0, 0, 20, 20}, 0.5f)}, cfg);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].key, "B");
}

TEST(CandidateFilter, DegenerateBoxesDropped) {
  nc::QualityConfig cfg;
  auto out = nv::filter_candidates(
      {cand("A", {0, 0, 0, 20}, 0.9f), cand("B", {0, 0, -5, 20}, 0.9f)}, cfg);
  EXPECT_TRUE(out.empty());
}

TEST(CandidateFilter, SameKeyOverlapsSuppressed) {
  nc::QualityConfig cfg;
  cfg.nms_iou = 0.45f;
  auto out = nv::filter_candidates({cand("A", {0, 0, 20, 20}, 0.7f),
                                    cand("A", {1, 1, 20, 20}, 0.9f),
                                    cand("A", {60, 60, 20, 20}, 0.6f)},
                                   cfg);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_FLOAT_EQ(out[0].confidence, 0.9f);
  EXPECT_FLOAT_EQ(out[1].confidence, 0.6f);
}

TEST(CandidateFilter, DifferentKeysNeverSuppressEachOther) {
  nc::QualityConfig cfg;
  auto out = nv::filter_candidates(
      {cand("A", {0, 0, 20, 20}, 0.9f), cand("B", {0, 0, 20, 20}, 0.8f)}, cfg);
  EXPECT_EQ(out.size(), 2u);
}

TEST(CandidateFilter, GeometryRules) {
  nc::QualityConfig cfg;
  cfg.min_size_px = 10.f;
  cfg.max_size_px = 100.f;
  cfg.aspect_min = 0.5f;
  cfg.aspect_max = 2.0f;
  auto out = nv::filter_candidates({cand("small", {0, 0, 5, 20}, 0.9f),
                                    cand("large", {0, 0, 150, 90}, 0.9f),
                                    cand("wide", {0, 0, 90, 30}, 0.9f),
                                    cand("ok", {0, 0, 40, 30}, 0.9f)},
                                   cfg);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].key, "ok");
}

TEST(CandidateFilter, UnknownAndExcludedKeysDropped) {
  nc::QualityConfig cfg;
  const auto inv = view_of({"A", "B"}, {"B"});
  nv::FilterContext ctx;
  ctx.inventory = &inv;
  auto out = nv::filter_candidates({cand("A", {0, 0, 20, 20}, 0.99f),
                                    cand("B", {30, 0, 20, 20}, 0.99f),
                                    cand("Z", {60, 0, 20, 20}, 0.99f)},
                                   cfg, ctx);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].key, "A");
}

TEST(CandidateFilter, CapKeepsHighestConfidence) {
  nc::QualityConfig cfg;
  cfg.max_candidates = 2;
  auto out = nv::filter_candidates({cand("A", {0, 0, 20, 20}, 0.6f),
                                    cand("B", {0, 0, 20, 20}, 0.95f),
                                    cand("C", {0, 0, 20, 20}, 0.8f)},
                                   cfg);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].key, "B");
  EXPECT_EQ(out[1].key, "C");
}

TEST(CandidateFilter, DeterministicAndOrderIndependent) {
  nc::QualityConfig cfg;
  cfg.max_candidates = 4;
  nc::CandidateList raw;
  for (int i = 0; i < 12; ++i) {
    raw.push_back(cand(i % 3 == 0 ? "A" : (i % 3 == 1 ? "B" : "C"),
                       {static_cast<float>(i * 7), 0.f, 20.f, 20.f},
                       0.5f + 0.04f * static_cast<float>(i)));
  }
  const auto expected = nv::filter_candidates(raw, cfg);
  EXPECT_EQ(nv::filter_candidates(raw, cfg), expected);

  std::mt19937 rng(11);
  for (int i = 0; i < 10; ++i) {
    std::shuffle(raw.begin(), raw.end(), rng);
    EXPECT_EQ(nv::filter_candidates(raw, cfg), expected);
  }
}

TEST(CandidateFilter, ColorConsistency) {
  nc::QualityConfig cfg;
  cfg.color_consistency = true;
  cfg.min_color_similarity = 0.6f;
  auto inv = view_of({"red_part", "blue_part", "plain"});
  inv.expected_colors = {{"red_part", "red"}, {"blue_part", "blue"}};
  const auto frame = red_square_frame();
  nv::FilterContext ctx{&inv, &frame};

  const nc::BBox square{20, 20, 40, 40};
  auto out = nv::filter_candidates({cand("red_part", square, 0.9f),
                                    cand("blue_part", square, 0.9f),
                                    cand("plain", square, 0.9f)},
                                   cfg, ctx);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].key, "plain");
  EXPECT_EQ(out[1].key, "red_part");

  cfg.color_consistency = false;
  EXPECT_EQ(nv::filter_candidates({cand("blue_part", square, 0.9f)}, cfg, ctx).size(), 1u);
}
