#include <brickfinder/vision/candidate_filter.hpp>
#include <brickfinder/vision/color.hpp>
#include <algorithm>
#include <cmath>
#include <tuple>

namespace brickfinder::vision {

namespace nc = brickfinder::core;

namespace {

bool canonical_less(const nc::Candidate& a, const nc::Candidate& b) {
  if (a.key != b.key) return a.key < b.key;
  if (a.confidence != b.confidence) return a.confidence > b.confidence;
  return std::tie(a.bbox.x, a.bbox.y, a.bbox.w, a.bbox.h, a.timestamp) <
         std::tie(b.bbox.x, b.bbox.y, b.bbox.w, b.bbox.h, b.timestamp);
}

bool degenerate(const nc::BBox& b) {
  return !std::isfinite(b.x) || !std::isfinite(b.y) || !std::isfinite(b.w) ||
         !std::isfinite(b.h) || b.w <= 0.f || b.h <= 0.f;
}

bool within_geometry(const nc::BBox& b, const nc::QualityConfig& cfg) {
  const float shorter = std::min(b.w, b.h);
  const float longer = std::max(b.w, b.h);
  if (shorter < cfg.min_size_px || longer > cfg.max_size_px) return false;
  const float aspect = b.w / b.h;
  return aspect >= cfg.aspect_min && aspect <= cfg.aspect_max;
}

bool color_consistent(const nc::Candidate& c,
                      const nc::QualityConfig& cfg,
                      const FilterContext& ctx) {
  if (!ctx.inventory) return true;
  auto expected_name = ctx.inventory->expected_colors.find(c.key);
  if (expected_name == ctx.inventory->expected_colors.end()) return true;
  auto expected = palette_color(expected_name->second);
  if (!expected) return true;

  auto seen = dominant_color(*ctx.frame, c.bbox);
  if (!seen) return false;
  return color_similarity(*seen, *expected) >= cfg.min_color_similarity;
}

}  // namespace

nc::CandidateList filter_candidates(const nc::CandidateList& raw,
                                    const nc::QualityConfig& config,
                                    const FilterContext& context) {
  const nc::InventoryView* inv = context.inventory;

  nc::CandidateList pool;
  pool.reserve(raw.size());
  for (const auto& c : raw) {
    if (inv && !inv->known.empty() && !inv->is_known(c.key)) continue;
    if (inv && inv->is_excluded(c.key)) continue;
    if (!std::isfinite(c.confidence) || c.confidence < config.confidence) continue;
    if (degenerate(c.bbox)) continue;
    pool.push_back(c);
  }
  std::sort(pool.begin(), pool.end(), canonical_less);

  // Same-key candidates are contiguous and strongest first after the sort.
  nc::CandidateList kept;
  kept.reserve(pool.size());
  std::size_t group_begin = 0;
  for (const auto& c : pool) {
    if (!kept.empty() && kept.back().key != c.key) group_begin = kept.size();
    const bool suppressed = std::any_of(
        kept.begin() + static_cast<std::ptrdiff_t>(group_begin), kept.end(),
        [&](const nc::Candidate& k) { return nc::iou(k.bbox, c.bbox) > config.nms_iou; });
    if (!suppressed) kept.push_back(c);
  }

  nc::CandidateList out;
  out.reserve(kept.size());
  const bool check_color = config.color_consistency && context.frame != nullptr;
  for (auto& c : kept) {
    if (!within_geometry(c.bbox, config)) continue;
    if (check_color && !color_consistent(c, config, context)) continue;
    out.push_back(std::move(c));
  }

  if (config.max_candidates > 0 && out.size() > config.max_candidates) {
    std::stable_sort(out.begin(), out.end(), [](const nc::Candidate& a, const nc::Candidate& b) {
      return a.confidence > b.confidence;
    });
    out.resize(config.max_candidates);
    std::sort(out.begin(), out.end(), canonical_less);
  }
  return out;
}

}  // namespace brickfinder::vision
