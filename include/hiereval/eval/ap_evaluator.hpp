#pragma once

#include <hiereval/eval/ground_truth.hpp>
#include <hiereval/eval/prediction_assembler.hpp>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace hiereval::eval {

/// How the precision/recall curve is summarised.
enum class ApMetric {
  Voc07ElevenPoint,  // mean of max precision at recall 0, 0.1, ..., 1
  Continuous,        // area under the monotone precision envelope
};

struct ApOptions {
  ApMetric metric{ApMetric::Voc07ElevenPoint};
  /// A detection matches a ground-truth box when IoU is strictly above this.
  float iou_threshold{0.5f};
};

using ApByClass = std::unordered_map<std::string, double>;

/// Summarises a precision/recall curve ordered by descending detection score.
[[nodiscard]] double average_precision(std::span<const double> recall,
                                       std::span<const double> precision,
                                       ApMetric metric);

/// AP of one class. Detections of all images are ranked by score and greedily matched
/// to the unmatched ground truth of their image with the highest IoU. Resets and then
/// sets the `detected` flags of `ground_truth`.
/// Returns NaN when the class has no ground truth.
/// Throws std::invalid_argument if the per-image lists are not index-aligned.
[[nodiscard]] double evaluate_class(const std::vector<std::vector<Detection>>& detections,
                                    std::vector<GroundTruthRecord>& ground_truth,
                                    const ApOptions& options);

/// AP for every class of `class_names` except index 0 (background).
/// `detections` is indexed like `class_names`; `ground_truth` is keyed by name.
[[nodiscard]] ApByClass evaluate_detections(const PerClassDetections& detections,
                                            PerClassGroundTruth& ground_truth,
                                            const std::vector<std::string>& class_names,
                                            const ApOptions& options);

/// Mean of the non-NaN values; NaN if there are none.
[[nodiscard]] double nan_mean(std::span<const double> values) noexcept;

}  // namespace hiereval::eval
