#pragma once

#include <brickfinder/core/candidate.hpp>
#include <brickfinder/core/frame.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace brickfinder::vision {

struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  friend bool operator==(const Rgb&, const Rgb&) = default;
};

/// Named part colours ("red", "dark_gray", ...). Lookup is case-insensitive;
/// spaces and dashes are treated as underscores. nullopt for unknown names.
[[nodiscard]] std::optional<Rgb> palette_color(std::string_view name);

/// All palette names, in table order.
[[nodiscard]] std::vector<std::string> palette_names();

/// 1 - euclidean RGB distance / (255 * sqrt(3)); 1 means identical.
[[nodiscard]] float color_similarity(Rgb a, Rgb b) noexcept;

/// Dominant colour of `box` within `frame`: the fullest bin of an 8x8x8 HSV
/// histogram, converted back to RGB. nullopt when the box does not overlap the
/// frame or the frame format is unsupported. Deterministic for equal inputs.
[[nodiscard]] std::optional<Rgb> dominant_color(const brickfinder::core::Frame& frame,
                                                const brickfinder::core::BBox& box);

}  // namespace brickfinder::vision
