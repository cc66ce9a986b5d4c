#include "frame_cv_utils.hpp"
#include <brickfinder/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace brickfinder::vision::detail {

namespace nc = brickfinder::core;

std::optional<cv::Mat> frame_to_mat(const nc::Frame& frame) {
  if (!frame.is_valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.size_bytes() / static_cast<std::size_t>(h);
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case nc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case nc::PixelFormat::RGB8:
    case nc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case nc::PixelFormat::RGBA8:
    case nc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

std::optional<cv::Mat> frame_to_bgr(const nc::Frame& frame) {
  auto view = frame_to_mat(frame);
  if (!view) return std::nullopt;

  cv::Mat bgr;
  switch (frame.format()) {
    case nc::PixelFormat::BGR8:
      bgr = view->clone();
      break;
    case nc::PixelFormat::RGB8:
      cv::cvtColor(*view, bgr, cv::COLOR_RGB2BGR);
      break;
    case nc::PixelFormat::RGBA8:
      cv::cvtColor(*view, bgr, cv::COLOR_RGBA2BGR);
      break;
    case nc::PixelFormat::BGRA8:
      cv::cvtColor(*view, bgr, cv::COLOR_BGRA2BGR);
      break;
    case nc::PixelFormat::Grayscale8:
      cv::cvtColor(*view, bgr, cv::COLOR_GRAY2BGR);
      break;
    case nc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return bgr;
}

nc::Frame mat_to_frame(const cv::Mat& mat, nc::PixelFormat format) {
  if (mat.empty()) return nc::Frame();

  const cv::Mat src = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(src.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(src.rows);
  const std::size_t len = src.total() * src.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), src.ptr(), len);
  return nc::Frame(w, h, format, std::move(buffer));
}

}  // namespace brickfinder::vision::detail
