#include <brickfinder/core/reorder_engine.hpp>
#include <algorithm>

namespace brickfinder::core {

OrderingSnapshot ReorderEngine::compute(const std::vector<TrackedItem>& items) {
  std::vector<const TrackedItem*> sorted;
  sorted.reserve(items.size());
  for (const auto& item : items) sorted.push_back(&item);

  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TrackedItem* a, const TrackedItem* b) {
                     if (a->detected_now != b->detected_now) return a->detected_now;
                     return a->original_position < b->original_position;
                   });

  OrderingSnapshot out;
  out.reserve(sorted.size());
  for (const auto* item : sorted) out.push_back(item->key);
  return out;
}

std::optional<OrderingSnapshot> ReorderEngine::update(const std::vector<TrackedItem>& items) {
  OrderingSnapshot next = compute(items);
  if (next == current_) return std::nullopt;
  current_ = std::move(next);
  return current_;
}

}  // namespace brickfinder::core
