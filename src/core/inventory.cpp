#include <brickfinder/core/inventory.hpp>
#include <brickfinder/core/log.hpp>

namespace brickfinder::core {

namespace {
constexpr const char* kTag = "inventory";
}  // namespace

std::size_t Inventory::load(const std::vector<InventoryEntry>& entries) {
  clear();
  for (const auto& e : entries) {
    if (e.key.empty()) {
      BF_LOGW(kTag, "skipping entry with empty key");
      continue;
    }
    if (e.required == 0) {
      BF_LOGW(kTag, "skipping %s: required count must be positive", e.key.c_str());
      continue;
    }
    if (auto* existing = find_mutable(e.key)) {
      existing->required += e.required;
      if (!existing->expected_color && e.expected_color) {
        existing->expected_color = e.expected_color;
      }
      continue;
    }
    TrackedItem item;
    item.key = e.key;
    item.required = e.required;
    item.original_position = items_.size();
    item.expected_color = e.expected_color;
    index_.emplace(item.key, items_.size());
    items_.push_back(std::move(item));
  }
  BF_LOGI(kTag, "loaded %zu items from %zu entries", items_.size(), entries.size());
  return items_.size();
}

void Inventory::clear() {
  items_.clear();
  index_.clear();
}

const TrackedItem* Inventory::find(const std::string& key) const {
  auto it = index_.find(key);
  return it == index_.end() ? nullptr : &items_[it->second];
}

TrackedItem* Inventory::find_mutable(const std::string& key) {
  auto it = index_.find(key);
  return it == index_.end() ? nullptr : &items_[it->second];
}

bool Inventory::set_manually_marked(const std::string& key, bool marked) {
  TrackedItem* item = find_mutable(key);
  if (!item) {
    BF_LOGW(kTag, "set_manually_marked: unknown key %s", key.c_str());
    return false;
  }
  item->manually_marked = marked;
  if (marked) item->detected_now = false;
  BF_LOGD(kTag, "%s manually %s", key.c_str(), marked ? "marked" : "unmarked");
  return true;
}

bool Inventory::increment_found(const std::string& key) {
  TrackedItem* item = find_mutable(key);
  if (!item) {
    BF_LOGW(kTag, "increment_found: unknown key %s", key.c_str());
    return false;
  }
  if (item->found >= item->required) {
    BF_LOGD(kTag, "%s already at maximum count", key.c_str());
    return false;
  }
  ++item->found;
  if (item->is_fully_found()) item->detected_now = false;
  BF_LOGD(kTag, "%s: %u/%u", key.c_str(), item->found, item->required);
  return true;
}

bool Inventory::decrement_found(const std::string& key) {
  TrackedItem* item = find_mutable(key);
  if (!item) {
    BF_LOGW(kTag, "decrement_found: unknown key %s", key.c_str());
    return false;
  }
  if (item->found == 0) {
    BF_LOGD(kTag, "%s already at minimum count", key.c_str());
    return false;
  }
  --item->found;
  BF_LOGD(kTag, "%s: %u/%u", key.c_str(), item->found, item->required);
  return true;
}

bool Inventory::apply_detection(const StableDetectionSnapshot& snapshot) {
  bool changed = false;
  for (auto& item : items_) {
    const bool detected =
        !item.excluded_from_detection() && snapshot.keys.contains(item.key);
    if (detected) {
      auto entered = snapshot.entered_at.find(item.key);
      if (!item.detected_now || !item.last_detected_at) {
        item.last_detected_at =
            entered != snapshot.entered_at.end() ? entered->second : snapshot.at;
      }
    }
    if (item.detected_now != detected) {
      item.detected_now = detected;
      changed = true;
    }
  }
  return changed;
}

bool Inventory::clear_detection() {
  bool changed = false;
  for (auto& item : items_) {
    if (item.detected_now) {
      item.detected_now = false;
      changed = true;
    }
  }
  return changed;
}

KeySet Inventory::detected_keys() const {
  KeySet out;
  for (const auto& item : items_) {
    if (item.detected_now) out.insert(item.key);
  }
  return out;
}

std::pair<std::uint64_t, std::uint64_t> Inventory::progress() const noexcept {
  std::uint64_t found = 0;
  std::uint64_t required = 0;
  for (const auto& item : items_) {
    found += item.found;
    required += item.required;
  }
  return {found, required};
}

std::shared_ptr<const InventoryView> Inventory::view() const {
  auto v = std::make_shared<InventoryView>();
  v->known.reserve(items_.size());
  for (const auto& item : items_) {
    v->known.insert(item.key);
    if (item.excluded_from_detection()) v->excluded.insert(item.key);
    if (item.expected_color) v->expected_colors.emplace(item.key, *item.expected_color);
  }
  return v;
}

}  // namespace brickfinder::core
