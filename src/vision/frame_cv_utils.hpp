#pragma once

#include <hiereval/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace hiereval::vision::detail {

/// Non-owning cv::Mat header over an 8-bit frame (Grayscale8 or BGR8).
/// nullopt for other formats or a buffer smaller than the frame geometry.
std::optional<cv::Mat> frame_to_mat(const core::Frame& frame);

/// Copies the pixels of `mat` row by row into a new, tightly packed Frame.
core::Frame mat_to_frame(const cv::Mat& mat, core::PixelFormat format);

}  // namespace hiereval::vision::detail
