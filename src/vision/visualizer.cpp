#include <hiereval/vision/visualizer.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <iostream>
#include <string>

namespace hiereval::vision {

std::size_t draw_boxes(core::Frame& image, std::span<const core::Box> boxes,
                       std::string_view label) {
  if (image.format() != core::PixelFormat::BGR8) return 0;
  auto mat = detail::frame_to_mat(image);
  if (!mat || boxes.empty()) return 0;

  const int width = mat->cols;
  const int height = mat->rows;
  const int n = static_cast<int>(boxes.size());
  std::size_t drawn = 0;

  for (int j = 0; j < n; ++j) {
    const auto& box = boxes[static_cast<std::size_t>(j)];
    int xmin = static_cast<int>(box.xmin);
    int ymin = static_cast<int>(box.ymin);
    int xmax = static_cast<int>(box.xmax);
    int ymax = static_cast<int>(box.ymax);
    if (xmax >= width || ymax >= height || xmin < 0 || ymin < 0) {
      std::cerr << "Box out of bounds: (" << xmin << "," << ymin << ") (" << xmax << ","
                << ymax << ")\n";
    }
    xmax = std::min(xmax, width - 1);
    ymax = std::min(ymax, height - 1);
    xmin = std::max(xmin, 0);
    ymin = std::max(ymin, 0);
    if (xmin >= xmax || ymin >= ymax) continue;

    const cv::Scalar color(255, 255 - j * 255 / n, j * 255 / n);
    cv::rectangle(*mat, cv::Point(xmin, ymin), cv::Point(xmax, ymax), color, 1);
    if (!label.empty()) {
      cv::putText(*mat, std::string(label), cv::Point(xmin, ymax), cv::FONT_HERSHEY_SIMPLEX, 1,
                  color, 1);
    }
    ++drawn;
  }
  return drawn;
}

}  // namespace hiereval::vision
