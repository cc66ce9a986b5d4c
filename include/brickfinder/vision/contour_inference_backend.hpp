#pragma once

#include <brickfinder/core/error.hpp>
#include <brickfinder/core/frame.hpp>
#include <brickfinder/vision/color.hpp>
#include <brickfinder/vision/inference_backend.hpp>
#include <brickfinder/vision/inference_result.hpp>
#include <string>
#include <vector>

namespace brickfinder::vision {

/// One identity the classical recognizer can emit, with its reference colour.
struct ColorTarget {
  std::string key;
  Rgb color;
};

struct ContourParams {
  double blur_sigma{1.5};
  double canny_low{50.0};
  double canny_high{150.0};
  int close_kernel{5};
  double min_area_px{64.0};
  double max_area_fraction{0.5};  // of the frame area
  float aspect_min{0.2f};
  float aspect_max{5.0f};
};

/// Model-free recognizer: edges -> closed contours -> bounding boxes, each
/// labelled with the target whose colour is closest to the box's dominant
/// colour. The score is that colour similarity. Class id i maps to targets[i].
class ContourInferenceBackend : public IInferenceBackend {
 public:
  explicit ContourInferenceBackend(std::vector<ColorTarget> targets, ContourParams params = {});

  [[nodiscard]] std::string_view name() const noexcept override { return "contour"; }

  [[nodiscard]] std::expected<InferenceResult, brickfinder::core::PipelineError> infer(
      const brickfinder::core::Frame& input) override;

  /// Target keys in class-id order (the labels of the ModelHandle).
  [[nodiscard]] std::vector<std::string> labels() const;

  [[nodiscard]] const ContourParams& params() const noexcept { return params_; }

 private:
  std::vector<ColorTarget> targets_;
  ContourParams params_;
};

}  // namespace brickfinder::vision
