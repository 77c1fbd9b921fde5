#pragma once

#include <hiereval/core/error.hpp>
#include <hiereval/core/frame.hpp>
#include <hiereval/vision/detector_backend.hpp>
#include <hiereval/vision/detector_outputs.hpp>
#include <memory>
#include <string>

namespace hiereval::vision {

/// ONNX Runtime backend for an exported hierarchical Faster R-CNN model.
///
/// Expected model:
/// - Input 0: float image, [1,3,H,W] (NCHW) or [1,H,W,3] (NHWC); dynamic H/W accepted.
/// - Optional input 1: float dims [1,6] = (pad_w, pad_h, scaled_w, scaled_h, orig_w, orig_h).
/// - Outputs named as in OutputNames (cls_pred, rpn_rois, bbox_regr by default); every
///   float output is copied out as a Tensor2D (last dimension = columns) and the typed
///   fields are filled by name.
///
/// Input contract: Frame must be Float32Planar (HWC) at the model's input size; the
/// backend transposes to NCHW when the model asks for it.
class OnnxDetectorBackend : public IDetectorBackend {
 public:
  /// Throws Ort::Exception if the model cannot be loaded and std::runtime_error if its
  /// inputs do not match the contract above.
  explicit OnnxDetectorBackend(std::string model_path, OutputNames output_names = {});

  ~OnnxDetectorBackend() override;

  OnnxDetectorBackend(const OnnxDetectorBackend&) = delete;
  OnnxDetectorBackend& operator=(const OnnxDetectorBackend&) = delete;

  [[nodiscard]] std::expected<DetectorOutputs, core::EvalError> infer(
      const core::Frame& input, const LetterboxInfo& dims) override;

  [[nodiscard]] std::expected<void, core::EvalError> validate_input(
      const core::Frame& input) const override;

  void warmup() override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace hiereval::vision
