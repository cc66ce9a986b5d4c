#include <brickfinder/core/candidate.hpp>
#include <brickfinder/core/stability_tracker.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include <unordered_set>
#include <vector>

namespace nc = brickfinder::core;

namespace {

nc::CandidateList frame_with(const std::vector<std::string>& keys) {
  nc::CandidateList out;
  for (const auto& k : keys) out.push_back({k, {0, 0, 20, 20}, 0.9f, {}});
  return out;
}

nc::Timestamp t(int ms) { return nc::Timestamp{} + std::chrono::milliseconds(ms); }

}  // namespace

TEST(StabilityTracker, DefaultParams) {
  nc::StabilityTracker tracker;
  EXPECT_EQ(tracker.params().window, 5u);
  EXPECT_EQ(tracker.params().min_hits, 3u);
  EXPECT_EQ(tracker.params().max_misses, 8u);
}

TEST(StabilityTracker, InvalidParamsFallBackToDefaults) {
  nc::StabilityTracker tracker({3, 5, 2});  // K > N
  EXPECT_EQ(tracker.params().window, 5u);
  EXPECT_EQ(tracker.params().min_hits, 3u);
}

TEST(StabilityTracker, TurnsOnAfterKHits) {
  nc::StabilityTracker tracker({5, 3, 8});
  auto s1 = tracker.update(frame_with({"B"}), 1, t(0));
  auto s2 = tracker.update(frame_with({"B"}), 2, t(33));
  EXPECT_TRUE(s1.keys.empty());
  EXPECT_TRUE(s2.keys.empty());
  auto s3 = tracker.update(frame_with({"B"}), 3, t(66));
  EXPECT_EQ(s3.keys, nc::KeySet{"B"});
  ASSERT_TRUE(s3.entered_at.contains("B"));
  EXPECT_EQ(s3.entered_at.at("B"), t(66));
  EXPECT_EQ(s3.seq, 3u);
}

TEST(StabilityTracker, SingleFrameFlickerStaysOff) {
  nc::StabilityTracker tracker({5, 3, 8});
  for (int i = 0; i < 20; ++i) {
    // Present every third frame: at most 2 hits in any 5-frame window.
    auto s = tracker.update(frame_with(i % 3 == 0 ? std::vector<std::string>{"A"}
                                                   : std::vector<std::string>{}),
                            static_cast<std::uint64_t>(i), t(i));
    EXPECT_TRUE(s.keys.empty()) << "frame " << i;
  }
}

TEST(StabilityTracker, TurnsOffAfterMConsecutiveMisses) {
  nc::StabilityTracker tracker({5, 3, 4});
  for (int i = 0; i < 3; ++i) tracker.update(frame_with({"A"}), i, t(i));
  ASSERT_EQ(tracker.detected(), nc::KeySet{"A"});

  for (int i = 0; i < 3; ++i) {
    auto s = tracker.update({}, 10 + i, t(10 + i));
    EXPECT_EQ(s.keys, nc::KeySet{"A"}) << "miss " << i + 1;
  }
  auto off = tracker.update({}, 13, t(13));
  EXPECT_TRUE(off.keys.empty());
}

TEST(StabilityTracker, BriefOcclusionKeepsDetection) {
  nc::StabilityTracker tracker({5, 3, 8});
  for (int i = 0; i < 5; ++i) tracker.update(frame_with({"A"}), i, t(i));
  for (int i = 0; i < 4; ++i) tracker.update({}, 5 + i, t(5 + i));
  auto s = tracker.update(frame_with({"A"}), 9, t(9));
  EXPECT_EQ(s.keys, nc::KeySet{"A"});
  EXPECT_EQ(s.entered_at.at("A"), t(2));
}

TEST(StabilityTracker, ExcludedKeysNeverDetected) {
  nc::StabilityTracker tracker({5, 3, 8});
  const std::unordered_set<std::string> excluded{"A"};
  for (int i = 0; i < 10; ++i) {
    auto s = tracker.update(frame_with({"A", "B"}), i, t(i), excluded);
    EXPECT_FALSE(s.keys.contains("A"));
  }
  EXPECT_EQ(tracker.detected(), nc::KeySet{"B"});
}

TEST(StabilityTracker, ExclusionDropsExistingDetection) {
  nc::StabilityTracker tracker({5, 3, 8});
  for (int i = 0; i < 3; ++i) tracker.update(frame_with({"A"}), i, t(i));
  ASSERT_EQ(tracker.detected(), nc::KeySet{"A"});

  auto s = tracker.update(frame_with({"A"}), 3, t(3), {"A"});
  EXPECT_TRUE(s.keys.empty());

  // Un-excluding starts from scratch: K fresh hits are needed again.
  auto s2 = tracker.update(frame_with({"A"}), 4, t(4));
  EXPECT_TRUE(s2.keys.empty());
}

TEST(StabilityTracker, MultipleBoxesOfOneKeyCountOnce) {
  nc::StabilityTracker tracker({5, 3, 8});
  auto s = tracker.update(frame_with({"A", "A", "A"}), 1, t(1));
  EXPECT_TRUE(s.keys.empty());
}

TEST(StabilityTracker, ResetForgetsHistory) {
  nc::StabilityTracker tracker({5, 3, 8});
  for (int i = 0; i < 3; ++i) tracker.update(frame_with({"A"}), i, t(i));
  tracker.reset();
  EXPECT_TRUE(tracker.detected().empty());
  EXPECT_EQ(tracker.tracked_count(), 0u);
}

TEST(StabilityTracker, IdleTracksArePruned) {
  nc::StabilityTracker tracker({5, 3, 8});
  tracker.update(frame_with({"A"}), 0, t(0));
  for (int i = 1; i <= 6; ++i) tracker.update({}, i, t(i));
  EXPECT_EQ(tracker.tracked_count(), 0u);
}
