#pragma once

#include <hiereval/app/config.hpp>
#include <hiereval/app/test_set_reader.hpp>
#include <hiereval/core/box.hpp>
#include <hiereval/core/error.hpp>
#include <hiereval/core/frame.hpp>
#include <hiereval/eval/ap_evaluator.hpp>
#include <hiereval/eval/prediction_assembler.hpp>
#include <hiereval/hierarchy/hierarchy_mapper.hpp>
#include <hiereval/vision/detector_backend.hpp>
#include <hiereval/vision/letterbox_stage.hpp>
#include <hiereval/vision/normalize_stage.hpp>
#include <cstddef>
#include <expected>
#include <ostream>
#include <string>
#include <vector>

namespace hiereval::app {

/// Everything kept about one evaluated image until scoring.
struct ImageRecord {
  std::size_t index{0};
  std::string image_path;
  /// Original labels, padding removed, input-resolution pixels.
  std::vector<core::LabeledBox> ground_truth;
  eval::ImagePredictions predictions;
  /// Original BGR8 image and its letterbox geometry; only filled when visualizing.
  core::Frame display;
  vision::LetterboxInfo dims;
};

struct EvaluationReport {
  std::vector<std::string> class_names;  // mapped classes, index 0 = background
  eval::ApByClass aps;
  double mean_ap{0.0};
  std::size_t num_images{0};
};

/// Runs the detector over the test set and scores it against the hierarchy-expanded
/// ground truth. Single-threaded; every image's outputs are kept until scoring.
class EvaluationDriver {
 public:
  /// `mapper` and `backend` must outlive the driver.
  EvaluationDriver(EvalConfig config,
                   const hierarchy::HierarchyMapper& mapper,
                   vision::IDetectorBackend& backend);

  /// Loads, letterboxes and runs inference on one sample.
  [[nodiscard]] std::expected<ImageRecord, core::EvalError> evaluate_image(const TestSample& sample);

  /// Evaluates the first num_test_images samples (fewer if the set is smaller),
  /// scores them and, if configured, writes annotated images.
  /// Throws core::HierarchyConsistencyError if hierarchy and model disagree.
  [[nodiscard]] std::expected<EvaluationReport, core::EvalError> run(
      const std::vector<TestSample>& samples);

  /// Expands ground truth, assembles predictions and computes AP per class.
  /// Throws core::HierarchyConsistencyError if hierarchy and model disagree.
  [[nodiscard]] EvaluationReport score(const std::vector<ImageRecord>& records) const;

  /// Writes `<stem>_gt.png` and `<stem>_pred.png` into the output folder for every
  /// record that has a display frame, with boxes mapped back onto the original image.
  /// Returns the number of files written.
  std::size_t visualize(const std::vector<ImageRecord>& records) const;

 private:
  [[nodiscard]] std::expected<std::vector<core::Box>, core::EvalError> regress(
      const vision::DetectorOutputs& outputs, core::ImageDims input) const;

  EvalConfig config_;
  const hierarchy::HierarchyMapper& mapper_;
  vision::IDetectorBackend& backend_;
  vision::LetterboxStage letterbox_;
  vision::NormalizeStage normalize_;
};

/// Converts ground truth from original-image pixels to detector-input pixels.
[[nodiscard]] std::vector<core::LabeledBox> ground_truth_in_input_coordinates(
    const std::vector<core::LabeledBox>& ground_truth, const vision::LetterboxInfo& dims);

/// Outputs of a perfect detector: one region per ground-truth box, scored with the
/// box's training vector. Used by the mock backend.
[[nodiscard]] vision::NamedTensors echo_ground_truth_outputs(
    const hierarchy::HierarchyMapper& mapper,
    const std::vector<core::LabeledBox>& ground_truth,
    const vision::OutputNames& names);

/// `AP for <class> = <ap>` per non-background class, then `Mean AP = <map>`.
void print_report(const EvaluationReport& report, std::ostream& out);

[[nodiscard]] vision::OutputNames output_names(const EvalConfig& config);

}  // namespace hiereval::app
