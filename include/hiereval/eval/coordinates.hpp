#pragma once

#include <hiereval/core/box.hpp>
#include <optional>

namespace hiereval::eval {

/// Divides x by the image width and y by the image height (pixels -> 0-1).
[[nodiscard]] core::Box normalize_absolute(const core::Box& box, core::ImageDims image) noexcept;

/// Relative coordinates -> pixels of `dims`.
[[nodiscard]] core::Box scale_to_absolute(const core::Box& box, core::ImageDims dims) noexcept;

/// Maps relative coordinates of an unpadded image into the relative frame of the
/// square input it was letterboxed into (scaled to fit, padding centered on the
/// shorter axis). Identity for square images.
[[nodiscard]] core::Box apply_padding(const core::Box& box, core::ImageDims image) noexcept;

/// Inverse of apply_padding().
[[nodiscard]] core::Box remove_padding(const core::Box& box, core::ImageDims image) noexcept;

/// Describes the coordinates handed to to_image_input_coordinates().
struct CoordinateOptions {
  /// Coordinates are pixels on the original image (requires image_dims).
  bool is_absolute{false};
  /// Coordinates are relative (0-1); rescaled to input_dims at the end.
  bool relative{false};
  /// The image was letterboxed to a square input (requires image_dims).
  bool needs_padding_adaption{true};
  std::optional<core::ImageDims> image_dims;
  std::optional<core::ImageDims> input_dims;
};

/// Converts coordinates to absolute pixels of the detector input:
/// absolute -> relative, padding adaption, relative -> input pixels. Each step runs
/// only when selected by `options`.
[[nodiscard]] core::Box to_image_input_coordinates(core::Box box, const CoordinateOptions& options);

/// Center-form overload: converts to corner form first.
[[nodiscard]] core::Box to_image_input_coordinates(const core::CenterBox& box,
                                                   const CoordinateOptions& options);

/// Detector input pixels -> pixels of the original (unpadded) image.
[[nodiscard]] core::Box to_original_image_coordinates(const core::Box& box,
                                                      core::ImageDims image,
                                                      core::ImageDims input) noexcept;

}  // namespace hiereval::eval
