#pragma once

#include <hiereval/core/box.hpp>
#include <hiereval/core/error.hpp>
#include <hiereval/core/frame.hpp>
#include <hiereval/core/frame_stage.hpp>
#include <array>
#include <cstdint>
#include <expected>

namespace hiereval::vision {

/// Geometry of one letterboxed image.
struct LetterboxInfo {
  std::uint32_t pad_width{0};  // network input size
  std::uint32_t pad_height{0};
  std::uint32_t scaled_width{0};  // image size inside the padding
  std::uint32_t scaled_height{0};
  std::uint32_t original_width{0};
  std::uint32_t original_height{0};

  [[nodiscard]] core::ImageDims original() const noexcept {
    return {original_width, original_height};
  }
  [[nodiscard]] core::ImageDims input() const noexcept { return {pad_width, pad_height}; }

  /// Dims tensor in the order Faster R-CNN models expect it.
  [[nodiscard]] std::array<float, 6> as_dims_input() const noexcept {
    return {static_cast<float>(pad_width),      static_cast<float>(pad_height),
            static_cast<float>(scaled_width),   static_cast<float>(scaled_height),
            static_cast<float>(original_width), static_cast<float>(original_height)};
  }
};

/// Scales the image to fit a square input, keeping its aspect ratio, and pads the
/// shorter axis evenly on both sides.
class LetterboxStage : public core::IFrameStage {
 public:
  LetterboxStage(std::uint32_t input_size, std::uint8_t pad_value);

  [[nodiscard]] std::expected<core::Frame, core::EvalError> process(
      const core::Frame& input) override;

  [[nodiscard]] LetterboxInfo plan(core::ImageDims image) const noexcept;

  [[nodiscard]] std::uint32_t input_size() const noexcept { return input_size_; }

 private:
  std::uint32_t input_size_;
  std::uint8_t pad_value_;
};

}  // namespace hiereval::vision
