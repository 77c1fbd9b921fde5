#include <hiereval/eval/coordinates.hpp>
#include <stdexcept>

namespace hiereval::eval {

using core::Box;
using core::ImageDims;

Box normalize_absolute(const Box& box, ImageDims image) noexcept {
  const auto w = static_cast<float>(image.width);
  const auto h = static_cast<float>(image.height);
  return Box{box.xmin / w, box.ymin / h, box.xmax / w, box.ymax / h};
}

Box scale_to_absolute(const Box& box, ImageDims dims) noexcept {
  const auto w = static_cast<float>(dims.width);
  const auto h = static_cast<float>(dims.height);
  return Box{box.xmin * w, box.ymin * h, box.xmax * w, box.ymax * h};
}

Box apply_padding(const Box& box, ImageDims image) noexcept {
  Box out = box;
  if (image.width > image.height) {
    const float ratio = static_cast<float>(image.height) / static_cast<float>(image.width);
    const float offset = (1.f - ratio) / 2.f;
    out.ymin = box.ymin * ratio + offset;
    out.ymax = box.ymax * ratio + offset;
  } else if (image.width < image.height) {
    const float ratio = static_cast<float>(image.width) / static_cast<float>(image.height);
    const float offset = (1.f - ratio) / 2.f;
    out.xmin = box.xmin * ratio + offset;
    out.xmax = box.xmax * ratio + offset;
  }
  return out;
}

Box remove_padding(const Box& box, ImageDims image) noexcept {
  Box out = box;
  if (image.width > image.height) {
    const float ratio = static_cast<float>(image.height) / static_cast<float>(image.width);
    const float offset = (1.f - ratio) / 2.f;
    out.ymin = (box.ymin - offset) / ratio;
    out.ymax = (box.ymax - offset) / ratio;
  } else if (image.width < image.height) {
    const float ratio = static_cast<float>(image.width) / static_cast<float>(image.height);
    const float offset = (1.f - ratio) / 2.f;
    out.xmin = (box.xmin - offset) / ratio;
    out.xmax = (box.xmax - offset) / ratio;
  }
  return out;
}

Box to_image_input_coordinates(Box box, const CoordinateOptions& options) {
  bool relative = options.relative;
  if (options.is_absolute) {
    if (!options.image_dims) {
      throw std::invalid_argument("to_image_input_coordinates: absolute coordinates need image_dims");
    }
    box = normalize_absolute(box, *options.image_dims);
    relative = true;
  }

  if (options.needs_padding_adaption && options.image_dims) {
    box = apply_padding(box, *options.image_dims);
  }

  if (relative) {
    if (!options.input_dims) {
      throw std::invalid_argument("to_image_input_coordinates: relative coordinates need input_dims");
    }
    box = scale_to_absolute(box, *options.input_dims);
  }
  return box;
}

Box to_image_input_coordinates(const core::CenterBox& box, const CoordinateOptions& options) {
  return to_image_input_coordinates(core::to_corner(box), options);
}

Box to_original_image_coordinates(const Box& box, ImageDims image, ImageDims input) noexcept {
  const Box relative = normalize_absolute(box, input);
  return scale_to_absolute(remove_padding(relative, image), image);
}

}  // namespace hiereval::eval
