#pragma once

#include <hiereval/core/box.hpp>
#include <hiereval/hierarchy/hierarchy_mapper.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace hiereval::eval {

/// Ground truth of one class on one image, as consumed by the AP evaluator.
/// `difficult` is always false; `detected` is matching state owned by the evaluator.
struct GroundTruthRecord {
  std::vector<core::Box> boxes;
  std::vector<bool> difficult;
  std::vector<bool> detected;
};

/// Class name -> one record per image (index-aligned with the detections).
using PerClassGroundTruth = std::unordered_map<std::string, std::vector<GroundTruthRecord>>;

/// Expands single-label ground truth into every class the hierarchy implies
/// (e.g. an "apple" box also becomes a "fruit" box).
class GroundTruthExpander {
 public:
  explicit GroundTruthExpander(const hierarchy::HierarchyMapper& mapper) : mapper_(mapper) {}

  /// One derived box per active mapped class (background excluded); labels are
  /// mapped class indices.
  /// Throws core::HierarchyConsistencyError if the box's own class is not among them.
  [[nodiscard]] std::vector<core::LabeledBox> expand_box(const core::LabeledBox& gt) const;

  /// \param images Per image, ground-truth boxes with original labels; padding
  ///        entries (label 0) must already be removed.
  /// Every non-background class gets exactly images.size() records.
  [[nodiscard]] PerClassGroundTruth expand(
      const std::vector<std::vector<core::LabeledBox>>& images) const;

 private:
  const hierarchy::HierarchyMapper& mapper_;
};

}  // namespace hiereval::eval
