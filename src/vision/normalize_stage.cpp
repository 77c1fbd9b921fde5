#include <hiereval/vision/normalize_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>

namespace hiereval::vision {

NormalizeStage::NormalizeStage(float mean, float scale) : mean_(mean), scale_(scale) {}

std::expected<core::Frame, core::EvalError> NormalizeStage::process(const core::Frame& input) {
  if (input.format() != core::PixelFormat::BGR8) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }
  const auto bgr = detail::frame_to_mat(input);
  if (!bgr) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }

  // (pixel - mean) * scale, channel order kept.
  cv::Mat normalized;
  bgr->convertTo(normalized, CV_32FC3, scale_, -mean_ * scale_);
  return detail::mat_to_frame(normalized, core::PixelFormat::Float32Planar);
}

}  // namespace hiereval::vision
