#pragma once

#include <hiereval/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace hiereval::vision {

/// Row-major 2-D float tensor (batch dimension removed).
struct Tensor2D {
  std::size_t rows{0};
  std::size_t cols{0};
  std::vector<float> values;

  [[nodiscard]] std::span<const float> row(std::size_t r) const {
    return std::span<const float>(values).subspan(r * cols, cols);
  }
};

/// Model outputs keyed by tensor name, as returned by an inference engine.
using NamedTensors = std::unordered_map<std::string, Tensor2D>;

/// Tensor names of the Faster R-CNN outputs the evaluation reads.
struct OutputNames {
  std::string cls_pred{"cls_pred"};
  std::string rpn_rois{"rpn_rois"};
  std::string bbox_regr{"bbox_regr"};
};

/// Typed view of one image's detector outputs.
struct DetectorOutputs {
  Tensor2D cls_pred;   // rois x raw hierarchy vector
  Tensor2D rpn_rois;   // rois x 4, input-resolution pixels (xmin, ymin, xmax, ymax)
  Tensor2D bbox_regr;  // rois x (4 * mapped classes) deltas

  [[nodiscard]] std::size_t num_rois() const noexcept { return rpn_rois.rows; }

  /// Looks up each output by name. Fails with MissingOutput if a name is absent and
  /// with InferenceFailed if the shapes do not agree.
  [[nodiscard]] static std::expected<DetectorOutputs, core::EvalError> from_named(
      NamedTensors tensors, const OutputNames& names);
};

}  // namespace hiereval::vision
