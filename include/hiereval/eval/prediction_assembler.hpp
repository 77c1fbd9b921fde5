#pragma once

#include <hiereval/core/box.hpp>
#include <hiereval/hierarchy/hierarchy_mapper.hpp>
#include <cstddef>
#include <span>
#include <vector>

namespace hiereval::eval {

/// One scored box of one class (the "x1 y1 x2 y2 score" row).
struct Detection {
  core::Box box{};
  float score{0.f};
};

/// Detection of a mapped class index.
struct LabeledDetection {
  Detection detection{};
  int label{0};
};

/// [class index][image index] -> detections. Index 0 (background) stays empty;
/// images without detections of a class hold an empty vector.
using PerClassDetections = std::vector<std::vector<std::vector<Detection>>>;

/// Raw network output of one image: one raw class vector per region and the region box.
struct ImagePredictions {
  std::vector<hierarchy::ClassVector> raw_outputs;
  std::vector<core::Box> rois;
};

/// Decodes raw per-region outputs through the hierarchy and sorts them per class.
class PredictionAssembler {
 public:
  /// \param num_classes Configured class count; every reduced vector must match it.
  PredictionAssembler(const hierarchy::HierarchyMapper& mapper, std::size_t num_classes)
      : mapper_(mapper), num_classes_(num_classes) {}

  /// Top-down decode + reduce one region; one detection per non-zero,
  /// non-background class. Throws core::HierarchyConsistencyError if the reduced
  /// vector does not have num_classes entries.
  [[nodiscard]] std::vector<LabeledDetection> assemble_region(std::span<const float> raw,
                                                              const core::Box& roi) const;

  /// Throws std::invalid_argument if an image has a different number of outputs and rois.
  [[nodiscard]] PerClassDetections assemble(const std::vector<ImagePredictions>& images) const;

  [[nodiscard]] std::size_t num_classes() const noexcept { return num_classes_; }

 private:
  const hierarchy::HierarchyMapper& mapper_;
  std::size_t num_classes_;
};

}  // namespace hiereval::eval
