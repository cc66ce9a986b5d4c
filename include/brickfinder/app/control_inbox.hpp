#pragma once

#include <brickfinder/app/model_loader.hpp>
#include <brickfinder/core/error.hpp>
#include <cstddef>
#include <deque>
#include <mutex>
#include <variant>
#include <vector>

namespace brickfinder::app {

/// Model load finished (success or failure), posted by the load worker.
struct LoadFinished {
  LoadResult result;
};

/// Capture source reported a fault / came back.
struct CaptureFaultEvent {
  core::CaptureFault fault;
};
struct CaptureRecovered {};

using ControlEvent = std::variant<LoadFinished, CaptureFaultEvent, CaptureRecovered>;

/// Multi-producer, single-consumer mailbox into the control thread. Workers
/// post immutable events; the control thread drains them and is the only one
/// that acts on them.
class ControlInbox {
 public:
  void post(ControlEvent event);

  /// Takes every queued event, oldest first.
  [[nodiscard]] std::vector<ControlEvent> drain();

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::deque<ControlEvent> events_;
};

}  // namespace brickfinder::app
