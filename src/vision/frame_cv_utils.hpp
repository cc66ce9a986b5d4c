#pragma once

#include <brickfinder/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace brickfinder::vision::detail {

/// Read-only cv::Mat view over a Frame's buffer (no copy). Returns nullopt if
/// the format is unsupported or the buffer is too small.
std::optional<cv::Mat> frame_to_mat(const brickfinder::core::Frame& frame);

/// BGR copy of a frame (converts from RGB / RGBA / BGRA / grey).
std::optional<cv::Mat> frame_to_bgr(const brickfinder::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
brickfinder::core::Frame mat_to_frame(const cv::Mat& mat,
                                      brickfinder::core::PixelFormat format);

}  // namespace brickfinder::vision::detail
