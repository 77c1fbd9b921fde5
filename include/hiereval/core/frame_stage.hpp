#pragma once

#include <hiereval/core/error.hpp>
#include <hiereval/core/frame.hpp>
#include <expected>

namespace hiereval::core {

/// One preprocessing step: Frame in, transformed Frame out.
class IFrameStage {
 public:
  virtual ~IFrameStage() = default;

  [[nodiscard]] virtual std::expected<Frame, EvalError> process(const Frame& input) = 0;
};

}  // namespace hiereval::core
