#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace brickfinder::core {

enum class DetectionState : std::uint8_t {
  Off,
  Loading,
  Ready,
  Active,
  Error,
};

[[nodiscard]] std::string_view to_string(DetectionState s) noexcept;

/// Control events accepted by the state machine.
enum class DetectionEvent : std::uint8_t {
  StartLoad,
  LoadSucceeded,
  LoadFailed,
  ToggleOn,
  ToggleOff,
  RetryLoad,
};

[[nodiscard]] std::string_view to_string(DetectionEvent e) noexcept;

/// Legal transitions:
///
///   OFF     --StartLoad-------------> LOADING
///   LOADING --LoadSucceeded(model)--> READY
///   LOADING --LoadFailed(reason)----> ERROR
///   READY   --ToggleOn--------------> ACTIVE
///   ACTIVE  --ToggleOff-------------> READY
///   ERROR   --RetryLoad-------------> LOADING
///
/// Everything else is rejected as a no-op (returns false, state unchanged).
/// A loaded model is never unloaded, so READY and ACTIVE never go back to OFF.
///
/// Threading: transitions are driven from the control thread only. state() is
/// an atomic read and may be called from any thread (the inference worker
/// checks it before every frame).
class DetectionStateMachine {
 public:
  using ChangeCallback =
      std::function<void(DetectionState from, DetectionState to, const std::string& reason)>;

  explicit DetectionStateMachine(DetectionState initial = DetectionState::Off);

  /// Invoked on the control thread after every applied transition.
  void set_on_change(ChangeCallback cb) { on_change_ = std::move(cb); }

  [[nodiscard]] DetectionState state() const noexcept {
    return state_.load(std::memory_order_acquire);
  }
  /// Reason attached to the last ERROR transition; empty otherwise.
  [[nodiscard]] const std::string& error_reason() const noexcept { return error_reason_; }

  bool start_load();
  bool load_succeeded(bool model_handle_present);
  bool load_failed(const std::string& reason);
  bool toggle_on();
  bool toggle_off();
  bool retry_load();

  [[nodiscard]] bool can_toggle() const noexcept {
    const auto s = state();
    return s == DetectionState::Ready || s == DetectionState::Active;
  }

 private:
  bool transition(DetectionEvent event, DetectionState expected, DetectionState to,
                  const std::string& reason);

  std::atomic<DetectionState> state_;
  std::string error_reason_;
  ChangeCallback on_change_;
};

}  // namespace brickfinder::core
