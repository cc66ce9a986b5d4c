#include <brickfinder/core/stability_tracker.hpp>
#include <brickfinder/core/log.hpp>

namespace brickfinder::core {

namespace {
constexpr const char* kTag = "stability";
}  // namespace

StabilityTracker::StabilityTracker(StabilityParams params) : params_(params) {
  if (!params_.valid()) {
    BF_LOGW(kTag, "invalid hysteresis (N=%zu K=%zu M=%zu); using defaults", params_.window,
            params_.min_hits, params_.max_misses);
    params_ = StabilityParams{};
  }
}

StableDetectionSnapshot StabilityTracker::update(const CandidateList& candidates,
                                                 std::uint64_t seq,
                                                 Timestamp at,
                                                 const std::unordered_set<std::string>& excluded) {
  for (const auto& key : excluded) {
    tracks_.erase(key);
  }

  KeySet present;
  for (const auto& c : candidates) {
    if (!excluded.contains(c.key)) present.insert(c.key);
  }
  for (const auto& key : present) {
    tracks_.try_emplace(key);
  }

  StableDetectionSnapshot out;
  out.seq = seq;
  out.at = at;

  for (auto it = tracks_.begin(); it != tracks_.end();) {
    Track& t = it->second;
    const bool seen = present.contains(it->first);

    t.window.push_back(seen);
    if (seen) ++t.hits;
    if (t.window.size() > params_.window) {
      if (t.window.front()) --t.hits;
      t.window.pop_front();
    }
    t.misses = seen ? 0 : t.misses + 1;

    if (!t.detected && t.hits >= params_.min_hits) {
      t.detected = true;
      t.entered_at = at;
      BF_LOGD(kTag, "%s on (frame %llu)", it->first.c_str(),
              static_cast<unsigned long long>(seq));
    } else if (t.detected && t.misses >= params_.max_misses) {
      t.detected = false;
      BF_LOGD(kTag, "%s off (frame %llu)", it->first.c_str(),
              static_cast<unsigned long long>(seq));
    }

    if (t.detected) {
      out.keys.insert(it->first);
      out.entered_at.emplace(it->first, t.entered_at);
    }

    // Nothing left inside the window: no history beyond hysteresis is kept.
    if (!t.detected && t.hits == 0 && t.misses >= params_.window) {
      it = tracks_.erase(it);
    } else {
      ++it;
    }
  }
  return out;
}

void StabilityTracker::reset() { tracks_.clear(); }

KeySet StabilityTracker::detected() const {
  KeySet out;
  for (const auto& [key, t] : tracks_) {
    if (t.detected) out.insert(key);
  }
  return out;
}

}  // namespace brickfinder::core
