#pragma once

#include <brickfinder/core/candidate.hpp>
#include <brickfinder/core/detection_set.hpp>
#include <brickfinder/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <string>
#include <unordered_set>

namespace brickfinder::core {

/// Hysteresis constants, in frames.
struct StabilityParams {
  std::size_t window{5};      // N: presence window length
  std::size_t min_hits{3};    // K: presences within the last N to turn on
  std::size_t max_misses{8};  // M: consecutive absences to turn off

  [[nodiscard]] bool valid() const noexcept {
    return window > 0 && min_hits > 0 && min_hits <= window && max_misses > 0;
  }
};

/// Turns per-frame candidate sets into a stable "currently detected" set.
///
/// A key becomes detected after appearing in at least K of the last N frames
/// and stops being detected after M consecutive frames without it. Keys in the
/// exclusion set are dropped at entry: their history is erased and they never
/// appear in the output.
///
/// Not thread-safe; owned by the inference worker.
class StabilityTracker {
 public:
  explicit StabilityTracker(StabilityParams params = {});

  /// Feed one processed frame. `candidates` may contain several boxes per key;
  /// presence is per key. Returns the full stable set after this frame.
  StableDetectionSnapshot update(const CandidateList& candidates,
                                 std::uint64_t seq,
                                 Timestamp at,
                                 const std::unordered_set<std::string>& excluded = {});

  /// Forget all history (new detection session).
  void reset();

  [[nodiscard]] const StabilityParams& params() const noexcept { return params_; }
  [[nodiscard]] KeySet detected() const;
  [[nodiscard]] std::size_t tracked_count() const noexcept { return tracks_.size(); }

 private:
  struct Track {
    std::deque<bool> window;  // most recent at back, size <= N
    std::size_t hits{0};      // number of true entries in window
    std::size_t misses{0};    // consecutive absences
    bool detected{false};
    Timestamp entered_at{};
  };

  StabilityParams params_;
  std::map<std::string, Track> tracks_;
};

}  // namespace brickfinder::core
