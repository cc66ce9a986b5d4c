#include <brickfinder/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <brickfinder/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>

namespace brickfinder::vision {

std::optional<brickfinder::core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) return std::nullopt;

  brickfinder::core::PixelFormat format = brickfinder::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = brickfinder::core::PixelFormat::Grayscale8;
  if (mat.channels() == 4) format = brickfinder::core::PixelFormat::BGRA8;
  if (mat.depth() != CV_8U) return std::nullopt;

  return detail::mat_to_frame(mat, format);
}

}  // namespace brickfinder::vision
