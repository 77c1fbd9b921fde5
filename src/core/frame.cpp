#include <hiereval/core/frame.hpp>

namespace hiereval::core {

std::size_t bytes_per_pixel(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return 1;
    case PixelFormat::BGR8:
      return 3;
    case PixelFormat::Float32Planar:
      return 3 * sizeof(float);
    case PixelFormat::Unknown:
      break;
  }
  return 0;
}

}  // namespace hiereval::core
