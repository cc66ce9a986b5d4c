#pragma once

#include <brickfinder/core/frame.hpp>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace brickfinder::app {

/// Bounded frame queue between capture and inference.
///
/// push() never blocks: when full, the oldest queued frame is dropped to make
/// room, so under backpressure the consumer always sees the freshest frames.
/// pop() blocks the consumer until a frame arrives, the timeout elapses or the
/// queue is closed.
class FrameQueue {
 public:
  /// Capacity is clamped to at least 1.
  explicit FrameQueue(std::size_t capacity = 2);

  /// Enqueue by move. Returns the number of frames dropped (0 or 1).
  std::size_t push(core::Frame frame);

  /// Wait up to `timeout` for a frame. nullopt on timeout or once closed and empty.
  [[nodiscard]] std::optional<core::Frame> pop(std::chrono::milliseconds timeout);

  /// Drop everything queued. Returns how many frames were discarded.
  std::size_t clear();

  /// Wake the consumer and refuse further pushes.
  void close();
  [[nodiscard]] bool closed() const;

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  /// Largest depth ever observed right after a push.
  [[nodiscard]] std::size_t high_water_mark() const;
  [[nodiscard]] std::uint64_t dropped() const;

 private:
  const std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<core::Frame> frames_;
  bool closed_{false};
  std::size_t high_water_{0};
  std::uint64_t dropped_{0};
};

}  // namespace brickfinder::app
