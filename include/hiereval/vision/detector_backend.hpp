#pragma once

#include <hiereval/core/error.hpp>
#include <hiereval/core/frame.hpp>
#include <hiereval/vision/detector_outputs.hpp>
#include <hiereval/vision/letterbox_stage.hpp>
#include <expected>

namespace hiereval::vision {

/// Abstract detector: letterboxed Float32Planar frame -> named Faster R-CNN outputs.
/// Implement infer(); optionally override validate_input and warmup.
class IDetectorBackend {
 public:
  virtual ~IDetectorBackend() = default;

  /// Single-image inference. `dims` describes how the frame was letterboxed.
  [[nodiscard]] virtual std::expected<DetectorOutputs, core::EvalError> infer(
      const core::Frame& input, const LetterboxInfo& dims) = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept.
  [[nodiscard]] virtual std::expected<void, core::EvalError> validate_input(
      const core::Frame& /*input*/) const {
    return {};
  }

  /// Optional: warmup run. Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace hiereval::vision
