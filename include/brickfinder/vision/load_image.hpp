#pragma once

#include <brickfinder/core/frame.hpp>
#include <optional>
#include <string>

namespace brickfinder::vision {

/// Load an image file into a Frame (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<brickfinder::core::Frame> load_frame_from_image(const std::string& path);

}  // namespace brickfinder::vision
