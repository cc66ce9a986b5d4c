#include <brickfinder/vision/contour_inference_backend.hpp>
#include <brickfinder/core/log.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

namespace brickfinder::vision {

namespace nc = brickfinder::core;

ContourInferenceBackend::ContourInferenceBackend(std::vector<ColorTarget> targets,
                                                 ContourParams params)
    : targets_(std::move(targets)), params_(params) {
  if (params_.close_kernel < 1) params_.close_kernel = 1;
  BF_LOGI("contour", "classical recognizer with %zu colour targets", targets_.size());
}

std::vector<std::string> ContourInferenceBackend::labels() const {
  std::vector<std::string> out;
  out.reserve(targets_.size());
  for (const auto& t : targets_) out.push_back(t.key);
  return out;
}

std::expected<InferenceResult, nc::PipelineError> ContourInferenceBackend::infer(
    const nc::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto bgr = detail::frame_to_bgr(input);
  if (!bgr) {
    return std::unexpected(nc::PipelineError::InvalidFrame);
  }

  InferenceResult result;
  if (targets_.empty()) return result;

  cv::Mat gray;
  cv::Mat edges;
  cv::cvtColor(*bgr, gray, cv::COLOR_BGR2GRAY);
  cv::GaussianBlur(gray, gray, cv::Size(0, 0), params_.blur_sigma);
  cv::Canny(gray, edges, params_.canny_low, params_.canny_high);
  const cv::Mat kernel = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(params_.close_kernel, params_.close_kernel));
  cv::morphologyEx(edges, edges, cv::MORPH_CLOSE, kernel);

  std::vector<std::vector<cv::Point>> contours;
  cv::findContours(edges, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

  const double max_area =
      params_.max_area_fraction * static_cast<double>(input.width()) * input.height();
  for (const auto& contour : contours) {
    const cv::Rect r = cv::boundingRect(contour);
    const double area = static_cast<double>(r.area());
    if (area < params_.min_area_px || area > max_area) continue;
    const float aspect = static_cast<float>(r.width) / static_cast<float>(r.height);
    if (aspect < params_.aspect_min || aspect > params_.aspect_max) continue;

    const nc::BBox box{static_cast<float>(r.x), static_cast<float>(r.y),
                       static_cast<float>(r.width), static_cast<float>(r.height)};
    auto colour = dominant_color(input, box);
    if (!colour) continue;

    std::size_t best = 0;
    float best_sim = -1.f;
    for (std::size_t i = 0; i < targets_.size(); ++i) {
      const float sim = color_similarity(*colour, targets_[i].color);
      if (sim > best_sim) {
        best_sim = sim;
        best = i;
      }
    }
    result.add(box.x, box.y, box.x + box.w, box.y + box.h, best_sim,
               static_cast<std::int64_t>(best));
  }
  return result;
}

}  // namespace brickfinder::vision
