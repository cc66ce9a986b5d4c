#include <brickfinder/core/detection_state.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace nc = brickfinder::core;
using S = nc::DetectionState;

namespace {

bool apply(nc::DetectionStateMachine& sm, nc::DetectionEvent e) {
  switch (e) {
    case nc::DetectionEvent::StartLoad:
      return sm.start_load();
    case nc::DetectionEvent::LoadSucceeded:
      return sm.load_succeeded(true);
    case nc::DetectionEvent::LoadFailed:
      return sm.load_failed("x");
    case nc::DetectionEvent::ToggleOn:
      return sm.toggle_on();
    case nc::DetectionEvent::ToggleOff:
      return sm.toggle_off();
    case nc::DetectionEvent::RetryLoad:
      return sm.retry_load();
  }
  return false;
}

struct Recorder {
  std::vector<std::pair<S, S>> transitions;
  std::string last_reason;

  void attach(nc::DetectionStateMachine& sm) {
    sm.set_on_change([this](S from, S to, const std::string& reason) {
      transitions.emplace_back(from, to);
      last_reason = reason;
    });
  }
};

}  // namespace

TEST(DetectionStateMachine, StartsOff) {
  nc::DetectionStateMachine sm;
  EXPECT_EQ(sm.state(), S::Off);
  EXPECT_FALSE(sm.can_toggle());
}

TEST(DetectionStateMachine, HappyPath) {
  nc::DetectionStateMachine sm;
  Recorder rec;
  rec.attach(sm);

  EXPECT_TRUE(sm.start_load());
  EXPECT_EQ(sm.state(), S::Loading);
  EXPECT_TRUE(sm.load_succeeded(true));
  EXPECT_EQ(sm.state(), S::Ready);
  EXPECT_TRUE(sm.toggle_on());
  EXPECT_EQ(sm.state(), S::Active);
  EXPECT_TRUE(sm.toggle_off());
  EXPECT_EQ(sm.state(), S::Ready);

  const std::vector<std::pair<S, S>> expected = {
      {S::Off, S::Loading}, {S::Loading, S::Ready}, {S::Ready, S::Active}, {S::Active, S::Ready}};
  EXPECT_EQ(rec.transitions, expected);
}

TEST(DetectionStateMachine, ToggleRejectedOutsideReadyAndActive) {
  nc::DetectionStateMachine sm;
  Recorder rec;
  rec.attach(sm);

  EXPECT_FALSE(sm.toggle_on());
  EXPECT_FALSE(sm.toggle_off());
  EXPECT_EQ(sm.state(), S::Off);

  ASSERT_TRUE(sm.start_load());
  EXPECT_FALSE(sm.toggle_on());
  EXPECT_FALSE(sm.toggle_off());
  EXPECT_EQ(sm.state(), S::Loading);

  ASSERT_TRUE(sm.load_failed("missing"));
  EXPECT_FALSE(sm.toggle_on());
  EXPECT_EQ(sm.state(), S::Error);
  EXPECT_EQ(rec.transitions.size(), 2u);
}

TEST(DetectionStateMachine, DoubleStartLoadIsNoOp) {
  nc::DetectionStateMachine sm;
  EXPECT_TRUE(sm.start_load());
  EXPECT_FALSE(sm.start_load());
  EXPECT_EQ(sm.state(), S::Loading);
}

TEST(DetectionStateMachine, LoadSucceededNeedsModelHandle) {
  nc::DetectionStateMachine sm;
  ASSERT_TRUE(sm.start_load());
  EXPECT_FALSE(sm.load_succeeded(false));
  EXPECT_EQ(sm.state(), S::Loading);
}

TEST(DetectionStateMachine, ReadyNeverReturnsToOff) {
  nc::DetectionStateMachine sm;
  ASSERT_TRUE(sm.start_load());
  ASSERT_TRUE(sm.load_succeeded(true));
  EXPECT_FALSE(sm.start_load());
  EXPECT_FALSE(sm.retry_load());
  EXPECT_FALSE(sm.load_failed("late"));
  EXPECT_EQ(sm.state(), S::Ready);
}

TEST(DetectionStateMachine, FailureCarriesReasonAndRetryLoads) {
  nc::DetectionStateMachine sm;
  Recorder rec;
  rec.attach(sm);
  ASSERT_TRUE(sm.start_load());
  ASSERT_TRUE(sm.load_failed("FileNotFound: model.onnx"));
  EXPECT_EQ(sm.error_reason(), "FileNotFound: model.onnx");
  EXPECT_EQ(rec.last_reason, "FileNotFound: model.onnx");

  EXPECT_TRUE(sm.retry_load());
  EXPECT_EQ(sm.state(), S::Loading);
  EXPECT_TRUE(sm.error_reason().empty());
}

TEST(DetectionStateMachine, EmptyFailureReasonGetsDefault) {
  nc::DetectionStateMachine sm;
  ASSERT_TRUE(sm.start_load());
  ASSERT_TRUE(sm.load_failed(""));
  EXPECT_FALSE(sm.error_reason().empty());
}

TEST(DetectionStateMachine, IllegalEventsNeverChangeState) {
  const std::vector<nc::DetectionEvent> all = {
      nc::DetectionEvent::StartLoad, nc::DetectionEvent::LoadSucceeded,
      nc::DetectionEvent::LoadFailed, nc::DetectionEvent::ToggleOn,
      nc::DetectionEvent::ToggleOff, nc::DetectionEvent::RetryLoad};

  // Every (state, event) pair that is not in the transition table is a no-op.
  const std::vector<std::pair<S, nc::DetectionEvent>> legal = {
      {S::Off, nc::DetectionEvent::StartLoad},
      {S::Loading, nc::DetectionEvent::LoadSucceeded},
      {S::Loading, nc::DetectionEvent::LoadFailed},
      {S::Ready, nc::DetectionEvent::ToggleOn},
      {S::Active, nc::DetectionEvent::ToggleOff},
      {S::Error, nc::DetectionEvent::RetryLoad}};

  for (S s : {S::Off, S::Loading, S::Ready, S::Active, S::Error}) {
    for (auto e : all) {
      nc::DetectionStateMachine sm(s);
      const bool is_legal =
          std::find(legal.begin(), legal.end(), std::make_pair(s, e)) != legal.end();
      const bool applied = apply(sm, e);
      EXPECT_EQ(applied, is_legal) << nc::to_string(s) << " / " << nc::to_string(e);
      if (!is_legal) EXPECT_EQ(sm.state(), s);
    }
  }
}

TEST(DetectionStateMachine, StateNames) {
  EXPECT_EQ(nc::to_string(S::Off), "OFF");
  EXPECT_EQ(nc::to_string(S::Active), "ACTIVE");
  EXPECT_EQ(nc::to_string(S::Error), "ERROR");
}
