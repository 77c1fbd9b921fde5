#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace hiereval::app {

/// Inference backend type: mock (echoes ground truth) or onnx (real model).
enum class DetectorBackendType {
  Mock,
  Onnx,
};

/// Evaluation configuration: data files, model, input geometry, AP settings.
struct EvalConfig {
  std::string model_path;
  DetectorBackendType backend_type{DetectorBackendType::Mock};

  std::string class_map_path;
  std::string hierarchy_path;
  std::string test_image_list;
  std::string test_roi_file;
  std::size_t num_test_images{10};

  std::uint32_t input_size{850};           // square network input
  std::uint32_t input_rois_per_image{50};  // ground-truth padding per image
  std::uint8_t pad_value{114};
  float normalize_mean{0.f};
  float normalize_scale{1.f};

  float iou_threshold{0.5f};
  bool use_07_metric{true};
  bool apply_bbox_regression{false};

  bool visualize{false};
  std::string output_dir{"output"};

  std::string cls_pred_name{"cls_pred"};
  std::string rpn_rois_name{"rpn_rois"};
  std::string bbox_regr_name{"bbox_regr"};
};

/// Load config from a key=value file (one per line, '#' comments) on top of the
/// defaults. Relative data and model paths are resolved against the file's folder. Throws std::runtime_error if the file cannot be opened or a value
/// does not parse.
EvalConfig load_config(const std::string& path);

/// Default config when no file is provided.
EvalConfig default_config();

}  // namespace hiereval::app
