#include <hiereval/core/error.hpp>

namespace hiereval::core {

std::string_view to_string(EvalError error) noexcept {
  switch (error) {
    case EvalError::None:
      return "None";
    case EvalError::InvalidFrame:
      return "InvalidFrame";
    case EvalError::LoadFailed:
      return "LoadFailed";
    case EvalError::InferenceFailed:
      return "InferenceFailed";
    case EvalError::MissingOutput:
      return "MissingOutput";
    case EvalError::InvalidConfig:
      return "InvalidConfig";
    case EvalError::InvalidTestSet:
      return "InvalidTestSet";
    default:
      return "Unknown";
  }
}

}  // namespace hiereval::core
