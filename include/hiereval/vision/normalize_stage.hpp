#pragma once

#include <hiereval/core/error.hpp>
#include <hiereval/core/frame.hpp>
#include <hiereval/core/frame_stage.hpp>
#include <expected>

namespace hiereval::vision {

/// Converts an 8-bit BGR frame to Float32Planar: (pixel - mean) * scale.
class NormalizeStage : public core::IFrameStage {
 public:
  NormalizeStage(float mean, float scale);

  [[nodiscard]] std::expected<core::Frame, core::EvalError> process(
      const core::Frame& input) override;

 private:
  float mean_;
  float scale_;
};

}  // namespace hiereval::vision
