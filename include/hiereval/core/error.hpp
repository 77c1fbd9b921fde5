#pragma once

#include <stdexcept>
#include <string_view>

namespace hiereval::core {

/// Evaluation error codes; used with std::expected for recoverable failures.
enum class EvalError {
  None = 0,
  InvalidFrame,
  LoadFailed,
  InferenceFailed,
  MissingOutput,
  InvalidConfig,
  InvalidTestSet,
};

[[nodiscard]] std::string_view to_string(EvalError error) noexcept;

/// Hierarchy mapping and class table are out of sync (e.g. a ground-truth class is
/// missing from its own expansion, or a reduced vector has the wrong length).
/// Not recoverable: the evaluation run must abort.
class HierarchyConsistencyError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

}  // namespace hiereval::core
