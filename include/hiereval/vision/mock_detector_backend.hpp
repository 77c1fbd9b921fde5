#pragma once

#include <hiereval/vision/detector_backend.hpp>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

namespace hiereval::vision {

/// Mock backend returning configured outputs (for tests and the demo run).
class MockDetectorBackend : public IDetectorBackend {
 public:
  /// Computes outputs from the frame geometry, e.g. to echo ground truth.
  using Responder = std::function<NamedTensors(const core::Frame&, const LetterboxInfo&)>;

  explicit MockDetectorBackend(OutputNames names = {}) : names_(std::move(names)) {}

  /// Outputs for successive infer() calls; the last one repeats once exhausted.
  void set_outputs(std::vector<NamedTensors> outputs);

  /// Takes precedence over set_outputs().
  void set_responder(Responder responder);

  [[nodiscard]] std::expected<DetectorOutputs, core::EvalError> infer(
      const core::Frame& input, const LetterboxInfo& dims) override;

  [[nodiscard]] std::expected<void, core::EvalError> validate_input(
      const core::Frame& input) const override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_; }

 private:
  OutputNames names_;
  std::vector<NamedTensors> outputs_;
  Responder responder_;
  std::size_t calls_{0};
};

}  // namespace hiereval::vision
