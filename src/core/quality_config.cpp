#include <brickfinder/core/quality_config.hpp>
#include <brickfinder/core/log.hpp>
#include <cmath>
#include <string>

namespace brickfinder::core {

namespace {

constexpr const char* kTag = "quality";

bool in_unit_range(float v) { return std::isfinite(v) && v >= 0.f && v <= 1.f; }

std::unexpected<FilterConfigError> reject(std::string field, std::string reason) {
  return std::unexpected(FilterConfigError{std::move(field), std::move(reason)});
}

}  // namespace

std::expected<QualityConfig, FilterConfigError> validate_quality_config(
    const QualityConfig& c) {
  if (!in_unit_range(c.confidence)) {
    return reject("confidence", "must be within [0, 1], got " + std::to_string(c.confidence));
  }
  if (!in_unit_range(c.nms_iou)) {
    return reject("nms_iou", "must be within [0, 1], got " + std::to_string(c.nms_iou));
  }
  if (!std::isfinite(c.min_size_px) || c.min_size_px < 0.f) {
    return reject("min_size_px", "must be non-negative, got " + std::to_string(c.min_size_px));
  }
  if (!std::isfinite(c.max_size_px) || c.max_size_px <= c.min_size_px) {
    return reject("max_size_px", "must be greater than min_size_px, got " +
                                     std::to_string(c.max_size_px));
  }
  if (!std::isfinite(c.aspect_min) || c.aspect_min <= 0.f) {
    return reject("aspect_min", "must be positive, got " + std::to_string(c.aspect_min));
  }
  if (!std::isfinite(c.aspect_max) || c.aspect_max < c.aspect_min) {
    return reject("aspect_max", "must be >= aspect_min, got " + std::to_string(c.aspect_max));
  }
  if (!in_unit_range(c.min_color_similarity)) {
    return reject("min_color_similarity",
                  "must be within [0, 1], got " + std::to_string(c.min_color_similarity));
  }
  return c;
}

QualityConfigStore::QualityConfigStore(QualityConfig initial) {
  auto valid = validate_quality_config(initial);
  if (!valid) {
    BF_LOGW(kTag, "initial config rejected (%s: %s); using defaults",
            valid.error().field.c_str(), valid.error().reason.c_str());
    current_ = std::make_shared<const QualityConfig>();
  } else {
    current_ = std::make_shared<const QualityConfig>(*valid);
  }
}

std::expected<void, FilterConfigError> QualityConfigStore::update(const QualityConfig& config) {
  auto valid = validate_quality_config(config);
  if (!valid) {
    BF_LOGW(kTag, "rejected %s: %s", valid.error().field.c_str(),
            valid.error().reason.c_str());
    return std::unexpected(valid.error());
  }
  auto next = std::make_shared<const QualityConfig>(*valid);
  {
    std::lock_guard lock(mutex_);
    current_ = std::move(next);
  }
  BF_LOGI(kTag, "active: confidence=%.2f nms_iou=%.2f color=%d", config.confidence,
          config.nms_iou, config.color_consistency ? 1 : 0);
  return {};
}

std::shared_ptr<const QualityConfig> QualityConfigStore::snapshot() const {
  std::lock_guard lock(mutex_);
  return current_;
}

}  // namespace brickfinder::core
