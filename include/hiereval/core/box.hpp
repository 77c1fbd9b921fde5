#pragma once

#include <cstdint>

namespace hiereval::core {

/// Axis-aligned box in corner form (xmin, ymin, xmax, ymax).
/// Relative (0-1) or pixel coordinates depending on context.
struct Box {
  float xmin{0.f};
  float ymin{0.f};
  float xmax{0.f};
  float ymax{0.f};

  [[nodiscard]] float width() const noexcept { return xmax - xmin; }
  [[nodiscard]] float height() const noexcept { return ymax - ymin; }
  [[nodiscard]] float area() const noexcept;

  friend bool operator==(const Box&, const Box&) = default;
};

/// Axis-aligned box in center form (cx, cy, w, h).
struct CenterBox {
  float cx{0.f};
  float cy{0.f};
  float w{0.f};
  float h{0.f};
};

/// Box plus class label. For ground truth read from disk the label is the dataset's
/// original label (0 = padding); after expansion it is a mapped class index.
struct LabeledBox {
  Box box{};
  int label{0};

  friend bool operator==(const LabeledBox&, const LabeledBox&) = default;
};

/// Image width and height in pixels.
struct ImageDims {
  std::uint32_t width{0};
  std::uint32_t height{0};
};

[[nodiscard]] CenterBox to_center(const Box& box) noexcept;
[[nodiscard]] Box to_corner(const CenterBox& box) noexcept;

/// Intersection over union; 0 when either box is empty.
[[nodiscard]] float intersection_over_union(const Box& a, const Box& b) noexcept;

}  // namespace hiereval::core
