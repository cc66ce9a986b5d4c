#pragma once

#include <brickfinder/core/frame.hpp>
#include <cstdint>
#include <map>
#include <set>
#include <string>

namespace brickfinder::core {

/// Identity keys, ordered so that snapshots compare and print deterministically.
using KeySet = std::set<std::string>;

/// Tracker output for one processed frame: the full stable set (not a diff).
/// `seq` is the frame sequence number and orders snapshots; `epoch` is the
/// detection session it belongs to (bumped on every ACTIVE -> READY).
struct StableDetectionSnapshot {
  std::uint64_t seq{0};
  std::uint64_t epoch{0};
  Timestamp at{};
  KeySet keys;
  /// Entry time of every key in `keys` (when it became detected).
  std::map<std::string, Timestamp> entered_at;
};

}  // namespace brickfinder::core
