#include <hiereval/vision/letterbox_stage.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace hiereval::vision {

LetterboxStage::LetterboxStage(std::uint32_t input_size, std::uint8_t pad_value)
    : input_size_(input_size), pad_value_(pad_value) {}

LetterboxInfo LetterboxStage::plan(core::ImageDims image) const noexcept {
  LetterboxInfo info;
  info.pad_width = input_size_;
  info.pad_height = input_size_;
  info.original_width = image.width;
  info.original_height = image.height;

  const std::uint32_t longest = std::max(image.width, image.height);
  if (longest == 0) return info;
  const double scale = static_cast<double>(input_size_) / static_cast<double>(longest);
  info.scaled_width = std::min(
      input_size_, static_cast<std::uint32_t>(std::lround(image.width * scale)));
  info.scaled_height = std::min(
      input_size_, static_cast<std::uint32_t>(std::lround(image.height * scale)));
  return info;
}

std::expected<core::Frame, core::EvalError> LetterboxStage::process(const core::Frame& input) {
  if (input.empty()) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }

  auto mat_in = detail::frame_to_mat(input);
  if (!mat_in) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }

  const LetterboxInfo info = plan(input.dims());
  cv::Mat scaled;
  cv::resize(*mat_in, scaled,
             cv::Size(static_cast<int>(info.scaled_width), static_cast<int>(info.scaled_height)),
             0, 0, cv::INTER_LINEAR);

  const int pad_x = static_cast<int>(info.pad_width - info.scaled_width);
  const int pad_y = static_cast<int>(info.pad_height - info.scaled_height);
  cv::Mat padded;
  cv::copyMakeBorder(scaled, padded, pad_y / 2, pad_y - pad_y / 2, pad_x / 2,
                     pad_x - pad_x / 2, cv::BORDER_CONSTANT, cv::Scalar::all(pad_value_));

  return detail::mat_to_frame(padded, input.format());
}

}  // namespace hiereval::vision
