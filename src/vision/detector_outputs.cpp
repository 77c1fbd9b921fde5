#include <hiereval/vision/detector_outputs.hpp>
#include <iostream>

namespace hiereval::vision {

namespace {

std::expected<Tensor2D, core::EvalError> take(NamedTensors& tensors, const std::string& name) {
  auto it = tensors.find(name);
  if (it == tensors.end()) {
    std::cerr << "Detector output '" << name << "' not found\n";
    return std::unexpected(core::EvalError::MissingOutput);
  }
  if (it->second.values.size() != it->second.rows * it->second.cols) {
    return std::unexpected(core::EvalError::InferenceFailed);
  }
  return std::move(it->second);
}

}  // namespace

std::expected<DetectorOutputs, core::EvalError> DetectorOutputs::from_named(
    NamedTensors tensors, const OutputNames& names) {
  auto cls_pred = take(tensors, names.cls_pred);
  if (!cls_pred) return std::unexpected(cls_pred.error());
  auto rpn_rois = take(tensors, names.rpn_rois);
  if (!rpn_rois) return std::unexpected(rpn_rois.error());
  auto bbox_regr = take(tensors, names.bbox_regr);
  if (!bbox_regr) return std::unexpected(bbox_regr.error());

  if (rpn_rois->cols != 4 || cls_pred->rows != rpn_rois->rows ||
      bbox_regr->rows != rpn_rois->rows) {
    std::cerr << "Detector outputs disagree: cls_pred " << cls_pred->rows << "x"
              << cls_pred->cols << ", rpn_rois " << rpn_rois->rows << "x" << rpn_rois->cols
              << ", bbox_regr " << bbox_regr->rows << "x" << bbox_regr->cols << "\n";
    return std::unexpected(core::EvalError::InferenceFailed);
  }

  DetectorOutputs out;
  out.cls_pred = std::move(*cls_pred);
  out.rpn_rois = std::move(*rpn_rois);
  out.bbox_regr = std::move(*bbox_regr);
  return out;
}

}  // namespace hiereval::vision
