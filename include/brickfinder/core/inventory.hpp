#pragma once

#include <brickfinder/core/detection_set.hpp>
#include <brickfinder/core/frame.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace brickfinder::core {

/// One row handed over by the inventory loader.
struct InventoryEntry {
  std::string key;
  std::uint32_t required{1};
  std::optional<std::string> expected_color;  // palette name, e.g. "red"
};

/// One target part. `detected_now` is written only when a stable detection
/// snapshot is applied; `original_position` is fixed at load time.
struct TrackedItem {
  std::string key;
  std::uint32_t required{1};
  std::uint32_t found{0};
  bool manually_marked{false};
  bool detected_now{false};
  std::optional<Timestamp> last_detected_at;
  std::size_t original_position{0};
  std::optional<std::string> expected_color;

  [[nodiscard]] bool is_fully_found() const noexcept { return found >= required; }
  [[nodiscard]] std::uint32_t remaining() const noexcept {
    return found >= required ? 0u : required - found;
  }
  /// Manually marked and fully found items are never evaluated by detection.
  [[nodiscard]] bool excluded_from_detection() const noexcept {
    return manually_marked || is_fully_found();
  }
};

/// Immutable copy of what the inference worker needs from the inventory.
/// Published by the control thread whenever membership, marking or counters
/// change; the worker only ever reads a whole snapshot.
struct InventoryView {
  std::unordered_set<std::string> known;
  std::unordered_set<std::string> excluded;
  std::unordered_map<std::string, std::string> expected_colors;

  [[nodiscard]] bool is_known(const std::string& key) const { return known.contains(key); }
  [[nodiscard]] bool is_excluded(const std::string& key) const {
    return excluded.contains(key);
  }
};

/// The loaded inventory. Control-thread only: it is the single writer of every
/// TrackedItem, so no lock guards the item list.
class Inventory {
 public:
  /// Replaces the inventory. Insertion order seeds original_position; all
  /// counters and flags start at zero. Duplicate keys are merged (required
  /// counts add up). Returns the number of distinct items.
  std::size_t load(const std::vector<InventoryEntry>& entries);
  void clear();

  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }

  /// Items in original order (index == original_position).
  [[nodiscard]] const std::vector<TrackedItem>& items() const noexcept { return items_; }
  [[nodiscard]] const TrackedItem* find(const std::string& key) const;

  /// Returns false for unknown keys. Marking clears detected_now immediately.
  bool set_manually_marked(const std::string& key, bool marked);
  /// Bounded by [0, required]; returns false when unknown or at the bound.
  bool increment_found(const std::string& key);
  bool decrement_found(const std::string& key);

  /// Sets detected_now from a stable set. Excluded and unknown keys are
  /// ignored, so a marked item can never become detected here.
  /// Returns true when any detected_now flag changed.
  bool apply_detection(const StableDetectionSnapshot& snapshot);
  /// Clears every detected_now flag; returns true when any was set.
  bool clear_detection();

  [[nodiscard]] KeySet detected_keys() const;

  /// (found, required) summed over all items.
  [[nodiscard]] std::pair<std::uint64_t, std::uint64_t> progress() const noexcept;

  [[nodiscard]] std::shared_ptr<const InventoryView> view() const;

 private:
  TrackedItem* find_mutable(const std::string& key);

  std::vector<TrackedItem> items_;
  std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace brickfinder::core
