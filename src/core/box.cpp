#include <hiereval/core/box.hpp>
#include <algorithm>

namespace hiereval::core {

float Box::area() const noexcept {
  return std::max(0.f, width()) * std::max(0.f, height());
}

CenterBox to_center(const Box& box) noexcept {
  CenterBox c;
  c.cx = (box.xmin + box.xmax) / 2.f;
  c.cy = (box.ymin + box.ymax) / 2.f;
  c.w = box.xmax - box.xmin;
  c.h = box.ymax - box.ymin;
  return c;
}

Box to_corner(const CenterBox& box) noexcept {
  const float half_w = box.w / 2.f;
  const float half_h = box.h / 2.f;
  return Box{box.cx - half_w, box.cy - half_h, box.cx + half_w, box.cy + half_h};
}

float intersection_over_union(const Box& a, const Box& b) noexcept {
  const float iw = std::min(a.xmax, b.xmax) - std::max(a.xmin, b.xmin);
  const float ih = std::min(a.ymax, b.ymax) - std::max(a.ymin, b.ymin);
  if (iw <= 0.f || ih <= 0.f) return 0.f;
  const float inter = iw * ih;
  const float uni = a.area() + b.area() - inter;
  return uni > 0.f ? inter / uni : 0.f;
}

}  // namespace hiereval::core
