#include <hiereval/vision/mock_detector_backend.hpp>
#include <algorithm>

namespace hiereval::vision {

void MockDetectorBackend::set_outputs(std::vector<NamedTensors> outputs) {
  outputs_ = std::move(outputs);
}

void MockDetectorBackend::set_responder(Responder responder) {
  responder_ = std::move(responder);
}

std::expected<DetectorOutputs, core::EvalError> MockDetectorBackend::infer(
    const core::Frame& input, const LetterboxInfo& dims) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::size_t call = calls_++;
  if (responder_) {
    return DetectorOutputs::from_named(responder_(input, dims), names_);
  }
  if (outputs_.empty()) {
    return std::unexpected(core::EvalError::InferenceFailed);
  }
  return DetectorOutputs::from_named(outputs_[std::min(call, outputs_.size() - 1)], names_);
}

std::expected<void, core::EvalError> MockDetectorBackend::validate_input(
    const core::Frame& input) const {
  if (input.empty()) {
    return std::unexpected(core::EvalError::InvalidFrame);
  }
  return {};
}

}  // namespace hiereval::vision
