#pragma once

#include <brickfinder/core/detection_set.hpp>
#include <brickfinder/core/frame.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>

namespace brickfinder::app {

/// Coalesces per-frame stable sets into at most one update per interval.
///
/// The inference worker submit()s every snapshot into a single latest slot
/// (last write wins). The control thread calls poll(now) from its timer; when
/// the interval has elapsed and a snapshot is pending, poll returns it and the
/// slot empties. The payload is always the full set, never a diff.
///
/// Snapshots are ordered by `seq`: an older or equal seq than one already
/// pending or flushed is dropped, so updates are never applied out of order.
/// Snapshots tagged with an epoch other than the current one (from before a
/// toggle) are dropped too.
class BatchedUpdateDispatcher {
 public:
  explicit BatchedUpdateDispatcher(std::chrono::milliseconds interval = std::chrono::milliseconds(100));

  /// Any thread. Returns false when the snapshot was stale and dropped.
  bool submit(core::StableDetectionSnapshot snapshot);

  /// Control thread only.
  [[nodiscard]] std::optional<core::StableDetectionSnapshot> poll(core::Timestamp now);

  /// Starts a new detection session: drops the pending snapshot, resets seq
  /// ordering and returns the new epoch. Control thread only.
  std::uint64_t begin_epoch();
  [[nodiscard]] std::uint64_t epoch() const;

  [[nodiscard]] std::chrono::milliseconds interval() const;
  void set_interval(std::chrono::milliseconds interval);

  [[nodiscard]] bool has_pending() const;

  struct Stats {
    std::uint64_t submitted{0};
    std::uint64_t coalesced{0};  // overwritten before a flush
    std::uint64_t stale{0};      // dropped: old seq or old epoch
    std::uint64_t flushed{0};
  };
  [[nodiscard]] Stats stats() const;

 private:
  std::chrono::milliseconds interval_;
  mutable std::mutex mutex_;
  std::optional<core::StableDetectionSnapshot> pending_;
  std::uint64_t epoch_{0};
  std::optional<std::uint64_t> last_seq_;  // highest seq accepted in this epoch
  std::optional<core::Timestamp> last_flush_;
  Stats stats_;
};

}  // namespace brickfinder::app
