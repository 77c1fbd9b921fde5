#pragma once

#include <hiereval/core/box.hpp>
#include <hiereval/core/frame.hpp>
#include <cstddef>
#include <span>
#include <string_view>

namespace hiereval::vision {

/// Draws pixel-coordinate boxes onto a BGR8 frame in place.
///
/// Box j of n gets colour (255, 255 - j*255/n, j*255/n) (BGR) so rank order is visible;
/// `label` (if non-empty) is written at the bottom-left corner. Boxes reaching outside
/// the image are reported on std::cerr and clamped; boxes that are empty after
/// clamping are skipped.
///
/// \return Number of boxes drawn; 0 if the frame is not BGR8.
std::size_t draw_boxes(core::Frame& image, std::span<const core::Box> boxes,
                       std::string_view label);

}  // namespace hiereval::vision
