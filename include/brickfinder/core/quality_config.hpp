#pragma once

#include <brickfinder/core/error.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>

namespace brickfinder::core {

/// Candidate quality gates. Treated as an immutable value: a new snapshot
/// replaces the old one as a whole (see QualityConfigStore).
struct QualityConfig {
  float confidence{0.5f};         // [0,1], minimum candidate confidence
  float nms_iou{0.45f};           // [0,1], same-identity boxes above this IoU collapse
  float min_size_px{8.f};         // shorter box side must be >= this
  float max_size_px{2000.f};      // longer box side must be <= this
  float aspect_min{0.2f};         // w / h lower bound
  float aspect_max{5.0f};         // w / h upper bound
  bool color_consistency{false};  // drop candidates whose colour does not match
  float min_color_similarity{0.6f};  // [0,1], used when color_consistency is on
  std::size_t max_candidates{10};    // per frame, highest confidence first; 0 = unlimited

  friend bool operator==(const QualityConfig&, const QualityConfig&) = default;
};

/// Checks ranges; returns the config unchanged when valid.
[[nodiscard]] std::expected<QualityConfig, FilterConfigError> validate_quality_config(
    const QualityConfig& config);

/// Holds the active QualityConfig snapshot. Readers get a shared_ptr to one
/// consistent snapshot that stays alive for their whole filter pass; writers
/// validate first and swap the pointer. Thread-safe.
class QualityConfigStore {
 public:
  explicit QualityConfigStore(QualityConfig initial = {});

  /// Validates and publishes; on error the previous snapshot stays active.
  [[nodiscard]] std::expected<void, FilterConfigError> update(const QualityConfig& config);

  [[nodiscard]] std::shared_ptr<const QualityConfig> snapshot() const;

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const QualityConfig> current_;
};

}  // namespace brickfinder::core
