#include <brickfinder/core/candidate.hpp>
#include <algorithm>

namespace brickfinder::core {

float iou(const BBox& a, const BBox& b) noexcept {
  const float left = std::max(a.x, b.x);
  const float top = std::max(a.y, b.y);
  const float right = std::min(a.x + a.w, b.x + b.w);
  const float bottom = std::min(a.y + a.h, b.y + b.h);
  if (right <= left || bottom <= top) return 0.f;

  const float inter = (right - left) * (bottom - top);
  const float uni = a.area() + b.area() - inter;
  return uni > 0.f ? inter / uni : 0.f;
}

}  // namespace brickfinder::core
