#include <hiereval/eval/bbox_regression.hpp>
#include <algorithm>
#include <cmath>

namespace hiereval::eval {

core::Box apply_box_deltas(const core::Box& roi, std::span<const float, 4> deltas) {
  const core::CenterBox c = core::to_center(roi);
  core::CenterBox out;
  out.cx = c.cx + deltas[0] * c.w;
  out.cy = c.cy + deltas[1] * c.h;
  out.w = c.w * std::exp(deltas[2]);
  out.h = c.h * std::exp(deltas[3]);
  return core::to_corner(out);
}

core::Box clip_box(const core::Box& box, core::ImageDims dims) noexcept {
  const auto w = static_cast<float>(dims.width);
  const auto h = static_cast<float>(dims.height);
  return core::Box{std::clamp(box.xmin, 0.f, w), std::clamp(box.ymin, 0.f, h),
                   std::clamp(box.xmax, 0.f, w), std::clamp(box.ymax, 0.f, h)};
}

}  // namespace hiereval::eval
