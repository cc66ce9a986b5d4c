#pragma once

#include <brickfinder/core/candidate.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/core/inventory.hpp>
#include <brickfinder/core/quality_config.hpp>

namespace brickfinder::vision {

/// Read-only inputs besides the config. Both pointers are optional.
struct FilterContext {
  /// Membership, exclusion (manual / fully found) and expected colours.
  /// Null: no membership gate, no colour expectations.
  const brickfinder::core::InventoryView* inventory{nullptr};
  /// Pixels for the colour-consistency rule. Null: colour rule is skipped.
  const brickfinder::core::Frame* frame{nullptr};
};

/// Candidate Filter. Pure: the same (raw, config, context) always yields the
/// same output, whatever the order of `raw`. Rules, in order:
///   0. drop keys the inventory does not know, and excluded keys
///   1. drop confidence < config.confidence (and degenerate boxes)
///   2. per-identity non-max suppression: a box whose IoU with a stronger box
///      of the same key exceeds config.nms_iou is dropped
///   3. drop boxes with min(w,h) < min_size_px, max(w,h) > max_size_px or
///      w/h outside [aspect_min, aspect_max]
///   4. colour consistency (when enabled): drop boxes whose dominant colour is
///      less similar than min_color_similarity to the key's expected colour;
///      keys without a known expected colour pass
///   5. keep at most max_candidates, highest confidence first
/// Output is sorted by key, then confidence (descending), then box.
[[nodiscard]] brickfinder::core::CandidateList filter_candidates(
    const brickfinder::core::CandidateList& raw,
    const brickfinder::core::QualityConfig& config,
    const FilterContext& context = {});

}  // namespace brickfinder::vision
