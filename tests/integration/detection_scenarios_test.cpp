// End-to-end scenarios: capture frames -> queue -> mock recognizer -> filter ->
// stability -> batched updates -> inventory / ordering, driven through the
// controller the way a UI host would drive it.
#include <brickfinder/app/detection_controller.hpp>
#include <brickfinder/core/quality_config.hpp>
#include <support/controller_harness.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

namespace nba = brickfinder::app;
namespace nc = brickfinder::core;
namespace ts = brickfinder::test_support;

using namespace std::chrono_literals;
using S = nc::DetectionState;

namespace {

const std::vector<nc::InventoryEntry> kAbc = {
    {"A", 1, std::nullopt}, {"B", 1, std::nullopt}, {"C", 1, std::nullopt}};

}  // namespace

// Stable detection of B moves it to the top; A and C keep their relative order.
TEST(DetectionScenarios, DetectedItemMovesToTop) {
  ts::ControllerHarness h;
  h.mock->set_detections({{1, {10, 10, 24, 24}, 0.8f}});
  nba::DetectionController c(h.fast_options(), h.factory(), h.callbacks());
  ASSERT_TRUE(ts::bring_to_ready(c, kAbc));
  ASSERT_TRUE(c.toggle_on());

  ASSERT_TRUE(ts::pump_until(
      c, [&] { return c.ordering() == nc::OrderingSnapshot{"B", "A", "C"}; }, true));
  EXPECT_EQ(c.detected(), nc::KeySet{"B"});
  EXPECT_EQ(h.orderings.back(), (nc::OrderingSnapshot{"B", "A", "C"}));

  // B leaves the frame: after the miss window it returns to its original slot.
  h.mock->set_detections({});
  ASSERT_TRUE(ts::pump_until(
      c, [&] { return c.ordering() == nc::OrderingSnapshot{"A", "B", "C"}; }, true));
  EXPECT_TRUE(c.detected().empty());
}

// A manually marked item is never reported, however confident the recognizer.
TEST(DetectionScenarios, ManuallyMarkedItemNeverDetected) {
  ts::ControllerHarness h;
  h.mock->set_detections({{0, {10, 10, 24, 24}, 0.99f}, {1, {40, 10, 24, 24}, 0.8f}});
  nba::DetectionController c(h.fast_options(), h.factory(), h.callbacks());
  ASSERT_TRUE(ts::bring_to_ready(c, kAbc));
  ASSERT_TRUE(c.set_manually_marked("A", true));
  ASSERT_TRUE(c.toggle_on());

  // B proves frames are flowing through the whole chain.
  ASSERT_TRUE(ts::pump_until(c, [&] { return c.detected().contains("B"); }, true));
  ts::pump_for(c, 150ms);

  EXPECT_FALSE(c.detected().contains("A"));
  EXPECT_FALSE(c.inventory().find("A")->detected_now);
  for (const auto& set : h.detection_sets) EXPECT_FALSE(set.contains("A"));
  EXPECT_EQ(c.ordering(), (nc::OrderingSnapshot{"B", "A", "C"}));
}

// A second start request while loading is a no-op: one load, one model.
TEST(DetectionScenarios, DoubleStartLoadsOnce) {
  ts::ControllerHarness h;
  h.load_delay = 80ms;
  nba::DetectionController c(h.fast_options(), h.factory(), h.callbacks());
  c.load_inventory(kAbc);

  ASSERT_TRUE(c.start_load());
  EXPECT_FALSE(c.start_load());
  ASSERT_TRUE(ts::pump_until(c, [&] { return c.state() == S::Ready; }));
  ts::pump_for(c, 50ms, false);

  EXPECT_EQ(h.count_state(S::Loading), 1);
  EXPECT_EQ(h.count_state(S::Ready), 1);
  EXPECT_EQ(h.factory_calls.load(), 1);
  EXPECT_EQ(c.models_loaded(), 1u);
}

// Raising the confidence threshold takes effect on the next frames, no restart.
TEST(DetectionScenarios, ConfidenceChangeAppliesWithoutRestart) {
  ts::ControllerHarness h;
  h.mock->set_detections({{1, {10, 10, 24, 24}, 0.7f}});
  auto options = h.fast_options();
  options.quality.confidence = 0.5f;
  nba::DetectionController c(options, h.factory(), h.callbacks());
  ASSERT_TRUE(ts::bring_to_ready(c, kAbc));
  ASSERT_TRUE(c.toggle_on());
  ASSERT_TRUE(ts::pump_until(c, [&] { return c.detected().contains("B"); }, true));

  nc::QualityConfig stricter = *c.quality_config();
  stricter.confidence = 0.9f;
  ASSERT_TRUE(c.set_quality_config(stricter).has_value());
  ASSERT_TRUE(ts::pump_until(c, [&] { return c.detected().empty(); }, true));

  stricter.confidence = 0.5f;
  ASSERT_TRUE(c.set_quality_config(stricter).has_value());
  ASSERT_TRUE(ts::pump_until(c, [&] { return c.detected().contains("B"); }, true));

  EXPECT_EQ(c.state(), S::Active);
  EXPECT_EQ(h.factory_calls.load(), 1);
  EXPECT_EQ(c.models_loaded(), 1u);
}

// A full session with a failing first load, then retry, detection and reset.
TEST(DetectionScenarios, RecoverFromLoadErrorAndDetect) {
  ts::ControllerHarness h;
  h.failures_left = 1;
  h.mock->set_detections({{2, {10, 10, 24, 24}, 0.9f}});
  nba::DetectionController c(h.fast_options(), h.factory(), h.callbacks());
  c.load_inventory(kAbc);

  ASSERT_TRUE(c.start_load());
  ASSERT_TRUE(ts::pump_until(c, [&] { return c.state() == S::Error; }));
  ASSERT_TRUE(c.retry_load());
  ASSERT_TRUE(ts::pump_until(c, [&] { return c.state() == S::Ready; }));
  ASSERT_TRUE(c.toggle_on());
  ASSERT_TRUE(ts::pump_until(c, [&] { return c.detected() == nc::KeySet{"C"}; }, true));

  // Found the part: it leaves detection and goes back to its slot.
  ASSERT_TRUE(c.increment_found("C"));
  EXPECT_TRUE(c.detected().empty());
  EXPECT_EQ(c.ordering(), (nc::OrderingSnapshot{"A", "B", "C"}));
  ts::pump_for(c, 100ms);
  EXPECT_TRUE(c.detected().empty());
}
