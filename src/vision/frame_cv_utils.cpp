#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <cstring>
#include <vector>

namespace hiereval::vision::detail {

namespace {

std::optional<int> cv_type_of(core::PixelFormat format) {
  switch (format) {
    case core::PixelFormat::Grayscale8:
      return CV_8UC1;
    case core::PixelFormat::BGR8:
      return CV_8UC3;
    default:
      return std::nullopt;
  }
}

}  // namespace

std::optional<cv::Mat> frame_to_mat(const core::Frame& frame) {
  const auto type = cv_type_of(frame.format());
  if (!type || frame.empty()) return std::nullopt;
  if (frame.size_bytes() < core::Frame::min_bytes(frame.width(), frame.height(), frame.format())) {
    return std::nullopt;
  }

  auto* pixels = const_cast<std::byte*>(frame.data().data());
  return cv::Mat(static_cast<int>(frame.height()), static_cast<int>(frame.width()), *type, pixels,
                 frame.row_bytes());
}

core::Frame mat_to_frame(const cv::Mat& mat, core::PixelFormat format) {
  if (mat.empty()) return core::Frame();

  const std::size_t row_bytes = static_cast<std::size_t>(mat.cols) * mat.elemSize();
  std::vector<std::byte> buffer(row_bytes * static_cast<std::size_t>(mat.rows));
  for (int y = 0; y < mat.rows; ++y) {
    std::memcpy(buffer.data() + static_cast<std::size_t>(y) * row_bytes, mat.ptr(y), row_bytes);
  }
  return core::Frame(static_cast<std::uint32_t>(mat.cols), static_cast<std::uint32_t>(mat.rows),
                     format, std::move(buffer));
}

}  // namespace hiereval::vision::detail
