#pragma once

#include <brickfinder/core/quality_config.hpp>
#include <brickfinder/core/stability_tracker.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brickfinder::app {

/// Recognizer plug-in: mock (synthetic), onnx (neural model) or contour
/// (classical edges + colour, needs no model file).
enum class InferenceBackendType {
  Mock,
  Onnx,
  Contour,
};

[[nodiscard]] std::string_view to_string(InferenceBackendType t) noexcept;
[[nodiscard]] std::optional<InferenceBackendType> parse_backend_type(std::string_view s) noexcept;

/// Process configuration: recognizer, quality gates, hysteresis, pacing.
struct PipelineConfig {
  std::string model_path;
  InferenceBackendType backend_type{InferenceBackendType::Mock};
  std::vector<std::string> labels;  // class id -> identity key
  std::uint32_t input_width{640};   // used when the model input is dynamic
  std::uint32_t input_height{640};

  core::QualityConfig quality{};
  core::StabilityParams stability{};

  std::chrono::milliseconds batch_interval{100};
  std::size_t queue_capacity{2};
  std::uint32_t frame_skip{0};
  std::chrono::milliseconds shutdown_timeout{2000};
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line) or use defaults.
/// Unknown keys and malformed values are logged and ignored.
PipelineConfig load_config(const std::string& path);

/// Default config when no file is provided.
PipelineConfig default_config();

/// Applies one key=value pair. Returns false (and leaves `config` untouched)
/// when the key is unknown or the value does not parse.
bool apply_config_value(PipelineConfig& config, std::string_view key, std::string_view value);

/// Splits "a, b ,c" into {"a","b","c"}; empty fields are dropped.
std::vector<std::string> split_list(std::string_view s, char sep = ',');

}  // namespace brickfinder::app
