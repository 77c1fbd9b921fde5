#pragma once

#include <hiereval/core/box.hpp>
#include <span>

namespace hiereval::eval {

/// Applies Fast R-CNN box deltas (dx, dy, dw, dh) to a region:
/// centre shifts by (dx * w, dy * h), size scales by (exp(dw), exp(dh)).
[[nodiscard]] core::Box apply_box_deltas(const core::Box& roi, std::span<const float, 4> deltas);

/// Clamps a box to [0, width] x [0, height].
[[nodiscard]] core::Box clip_box(const core::Box& box, core::ImageDims dims) noexcept;

}  // namespace hiereval::eval
