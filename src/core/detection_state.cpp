#include <brickfinder/core/detection_state.hpp>
#include <brickfinder/core/log.hpp>

namespace brickfinder::core {

namespace {
constexpr const char* kTag = "state";
}  // namespace

std::string_view to_string(DetectionState s) noexcept {
  switch (s) {
    case DetectionState::Off:
      return "OFF";
    case DetectionState::Loading:
      return "LOADING";
    case DetectionState::Ready:
      return "READY";
    case DetectionState::Active:
      return "ACTIVE";
    case DetectionState::Error:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::string_view to_string(DetectionEvent e) noexcept {
  switch (e) {
    case DetectionEvent::StartLoad:
      return "startLoad";
    case DetectionEvent::LoadSucceeded:
      return "loadSucceeded";
    case DetectionEvent::LoadFailed:
      return "loadFailed";
    case DetectionEvent::ToggleOn:
      return "toggleOn";
    case DetectionEvent::ToggleOff:
      return "toggleOff";
    case DetectionEvent::RetryLoad:
      return "retryLoad";
  }
  return "unknown";
}

DetectionStateMachine::DetectionStateMachine(DetectionState initial) : state_(initial) {}

bool DetectionStateMachine::transition(DetectionEvent event,
                                       DetectionState expected,
                                       DetectionState to,
                                       const std::string& reason) {
  const DetectionState from = state();
  if (from != expected) {
    BF_LOGD(kTag, "%s ignored in %s", to_string(event).data(), to_string(from).data());
    return false;
  }
  error_reason_ = (to == DetectionState::Error) ? reason : std::string{};
  state_.store(to, std::memory_order_release);
  BF_LOGIs(kTag) << to_string(from) << " -> " << to_string(to) << " (" << to_string(event)
                 << ")";
  if (to == DetectionState::Error) {
    BF_LOGE(kTag, "detection error: %s", reason.c_str());
  }
  if (on_change_) on_change_(from, to, error_reason_);
  return true;
}

bool DetectionStateMachine::start_load() {
  return transition(DetectionEvent::StartLoad, DetectionState::Off, DetectionState::Loading, {});
}

bool DetectionStateMachine::load_succeeded(bool model_handle_present) {
  if (!model_handle_present) {
    BF_LOGW(kTag, "loadSucceeded without a model handle ignored");
    return false;
  }
  return transition(DetectionEvent::LoadSucceeded, DetectionState::Loading,
                    DetectionState::Ready, {});
}

bool DetectionStateMachine::load_failed(const std::string& reason) {
  return transition(DetectionEvent::LoadFailed, DetectionState::Loading, DetectionState::Error,
                    reason.empty() ? std::string("unknown error loading model") : reason);
}

bool DetectionStateMachine::toggle_on() {
  return transition(DetectionEvent::ToggleOn, DetectionState::Ready, DetectionState::Active, {});
}

bool DetectionStateMachine::toggle_off() {
  return transition(DetectionEvent::ToggleOff, DetectionState::Active, DetectionState::Ready, {});
}

bool DetectionStateMachine::retry_load() {
  return transition(DetectionEvent::RetryLoad, DetectionState::Error, DetectionState::Loading,
                    {});
}

}  // namespace brickfinder::core
