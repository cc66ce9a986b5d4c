#pragma once

#include <brickfinder/core/inventory.hpp>
#include <optional>
#include <string>
#include <vector>

namespace brickfinder::core {

/// Display order of identity keys.
using OrderingSnapshot = std::vector<std::string>;

/// Detected items first, then the rest; each partition ordered by
/// original_position. original_position is never written here, so an item
/// that leaves the detected set always returns to its original relative place.
class ReorderEngine {
 public:
  /// Pure ordering of `items` (any input order).
  [[nodiscard]] static OrderingSnapshot compute(const std::vector<TrackedItem>& items);

  /// Recomputes and remembers the ordering. Returns it only when it differs
  /// from the previously returned one, so callers redraw only on change.
  std::optional<OrderingSnapshot> update(const std::vector<TrackedItem>& items);

  [[nodiscard]] const OrderingSnapshot& current() const noexcept { return current_; }
  void reset() { current_.clear(); }

 private:
  OrderingSnapshot current_;
};

}  // namespace brickfinder::core
