#pragma once

#include <hiereval/core/box.hpp>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace hiereval::core {

/// Pixel layout of a Frame buffer.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  BGR8,           // as decoded by OpenCV
  Float32Planar,  // HWC float, 3 channels, network input
};

/// Bytes per pixel of `format`; 0 for Unknown.
[[nodiscard]] std::size_t bytes_per_pixel(PixelFormat format) noexcept;

/// One test image (or a preprocessed network input): geometry, format and an owned,
/// row-major buffer without row padding.
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width, std::uint32_t height, PixelFormat format,
        std::vector<std::byte> buffer)
      : dims_{width, height}, format_(format), buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return dims_.width; }
  [[nodiscard]] std::uint32_t height() const noexcept { return dims_.height; }
  [[nodiscard]] ImageDims dims() const noexcept { return dims_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept { return buffer_; }
  [[nodiscard]] std::span<const std::byte> data() const noexcept { return buffer_; }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Bytes of one image row for the frame's width and format.
  [[nodiscard]] std::size_t row_bytes() const noexcept {
    return static_cast<std::size_t>(dims_.width) * bytes_per_pixel(format_);
  }

  /// Buffer size a width x height image of `format` needs.
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width, std::uint32_t height,
                                             PixelFormat format) noexcept {
    return static_cast<std::size_t>(width) * height * bytes_per_pixel(format);
  }

 private:
  ImageDims dims_{};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace hiereval::core
