#include <hiereval/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>

namespace hiereval::vision {

std::optional<core::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) return std::nullopt;
  return detail::mat_to_frame(mat, core::PixelFormat::BGR8);
}

bool save_frame_to_image(const core::Frame& frame, const std::string& path) {
  auto mat = detail::frame_to_mat(frame);
  if (!mat) return false;
  return cv::imwrite(path, *mat);
}

}  // namespace hiereval::vision
