#pragma once

#include <hiereval/core/frame.hpp>
#include <optional>
#include <string>

namespace hiereval::vision {

/// Load an image file into a BGR8 Frame. Returns nullopt on failure.
std::optional<core::Frame> load_frame_from_image(const std::string& path);

/// Write a BGR8 or Grayscale8 Frame to disk; format chosen by extension.
bool save_frame_to_image(const core::Frame& frame, const std::string& path);

}  // namespace hiereval::vision
