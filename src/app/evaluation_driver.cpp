#include <hiereval/app/evaluation_driver.hpp>
#include <hiereval/eval/bbox_regression.hpp>
#include <hiereval/eval/coordinates.hpp>
#include <hiereval/eval/ground_truth.hpp>
#include <hiereval/vision/load_image.hpp>
#include <hiereval/vision/visualizer.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace hiereval::app {

namespace {

constexpr std::size_t kProgressInterval = 1000;
constexpr std::size_t kBoxCoords = 4;

void split_records(const std::vector<ImageRecord>& records,
                   std::vector<std::vector<core::LabeledBox>>& ground_truth,
                   std::vector<eval::ImagePredictions>& predictions) {
  ground_truth.reserve(records.size());
  predictions.reserve(records.size());
  for (const auto& r : records) {
    ground_truth.push_back(r.ground_truth);
    predictions.push_back(r.predictions);
  }
}

}  // namespace

vision::OutputNames output_names(const EvalConfig& config) {
  return vision::OutputNames{config.cls_pred_name, config.rpn_rois_name, config.bbox_regr_name};
}

EvaluationDriver::EvaluationDriver(EvalConfig config,
                                   const hierarchy::HierarchyMapper& mapper,
                                   vision::IDetectorBackend& backend)
    : config_(std::move(config)),
      mapper_(mapper),
      backend_(backend),
      letterbox_(config_.input_size, config_.pad_value),
      normalize_(config_.normalize_mean, config_.normalize_scale) {}

std::vector<core::LabeledBox> ground_truth_in_input_coordinates(
    const std::vector<core::LabeledBox>& ground_truth, const vision::LetterboxInfo& dims) {
  eval::CoordinateOptions options;
  options.is_absolute = true;
  options.needs_padding_adaption = true;
  options.image_dims = dims.original();
  options.input_dims = dims.input();

  std::vector<core::LabeledBox> out;
  out.reserve(ground_truth.size());
  for (const auto& gt : ground_truth) {
    out.push_back({eval::to_image_input_coordinates(gt.box, options), gt.label});
  }
  return out;
}

vision::NamedTensors echo_ground_truth_outputs(const hierarchy::HierarchyMapper& mapper,
                                               const std::vector<core::LabeledBox>& ground_truth,
                                               const vision::OutputNames& names) {
  vision::Tensor2D cls_pred{ground_truth.size(), mapper.raw_size(), {}};
  vision::Tensor2D rois{ground_truth.size(), kBoxCoords, {}};
  vision::Tensor2D deltas{ground_truth.size(), kBoxCoords * mapper.num_classes(), {}};
  deltas.values.assign(deltas.rows * deltas.cols, 0.f);

  for (const auto& gt : ground_truth) {
    const auto vectors = mapper.vectors_for_label(gt.label);
    cls_pred.values.insert(cls_pred.values.end(), vectors.train.begin(), vectors.train.end());
    rois.values.insert(rois.values.end(), {gt.box.xmin, gt.box.ymin, gt.box.xmax, gt.box.ymax});
  }

  vision::NamedTensors out;
  out.emplace(names.cls_pred, std::move(cls_pred));
  out.emplace(names.rpn_rois, std::move(rois));
  out.emplace(names.bbox_regr, std::move(deltas));
  return out;
}

std::expected<std::vector<core::Box>, core::EvalError> EvaluationDriver::regress(
    const vision::DetectorOutputs& outputs, core::ImageDims input) const {
  std::vector<core::Box> boxes;
  boxes.reserve(outputs.num_rois());
  for (std::size_t r = 0; r < outputs.num_rois(); ++r) {
    const auto roi = outputs.rpn_rois.row(r);
    const core::Box box{roi[0], roi[1], roi[2], roi[3]};

    const std::size_t label = mapper_.top_down_class(outputs.cls_pred.row(r));
    if (label == 0) {
      boxes.push_back(box);
      continue;
    }
    if (outputs.bbox_regr.cols < kBoxCoords * (label + 1)) {
      std::cerr << "bbox_regr has " << outputs.bbox_regr.cols << " columns, class " << label
                << " needs " << kBoxCoords * (label + 1) << "\n";
      return std::unexpected(core::EvalError::InferenceFailed);
    }
    const auto deltas = outputs.bbox_regr.row(r).subspan(kBoxCoords * label).first<kBoxCoords>();
    boxes.push_back(eval::clip_box(eval::apply_box_deltas(box, deltas), input));
  }
  return boxes;
}

std::expected<ImageRecord, core::EvalError> EvaluationDriver::evaluate_image(
    const TestSample& sample) {
  auto frame = vision::load_frame_from_image(sample.image_path);
  if (!frame) {
    std::cerr << "Failed to load image: " << sample.image_path << "\n";
    return std::unexpected(core::EvalError::LoadFailed);
  }

  const vision::LetterboxInfo dims = letterbox_.plan(frame->dims());
  auto letterboxed = letterbox_.process(*frame);
  if (!letterboxed) return std::unexpected(letterboxed.error());
  auto input = normalize_.process(*letterboxed);
  if (!input) return std::unexpected(input.error());

  auto valid = backend_.validate_input(*input);
  if (!valid) return std::unexpected(valid.error());
  auto outputs = backend_.infer(*input, dims);
  if (!outputs) return std::unexpected(outputs.error());

  ImageRecord record;
  record.index = sample.index;
  record.image_path = sample.image_path;
  record.ground_truth = ground_truth_in_input_coordinates(strip_padding(sample.rois), dims);

  for (std::size_t r = 0; r < outputs->num_rois(); ++r) {
    const auto scores = outputs->cls_pred.row(r);
    record.predictions.raw_outputs.emplace_back(scores.begin(), scores.end());
  }
  if (config_.apply_bbox_regression) {
    auto boxes = regress(*outputs, dims.input());
    if (!boxes) return std::unexpected(boxes.error());
    record.predictions.rois = std::move(*boxes);
  } else {
    for (std::size_t r = 0; r < outputs->num_rois(); ++r) {
      const auto roi = outputs->rpn_rois.row(r);
      record.predictions.rois.push_back({roi[0], roi[1], roi[2], roi[3]});
    }
  }

  if (config_.visualize) {
    record.display = std::move(*frame);
    record.dims = dims;
  }
  return record;
}

std::expected<EvaluationReport, core::EvalError> EvaluationDriver::run(
    const std::vector<TestSample>& samples) {
  std::size_t num_images = config_.num_test_images;
  if (num_images > samples.size()) {
    std::cerr << "Warning: " << num_images << " test images requested, only " << samples.size()
              << " available\n";
    num_images = samples.size();
  }

  std::cout << "Evaluating Faster R-CNN model for " << num_images << " images.\n";
  std::vector<ImageRecord> records;
  records.reserve(num_images);
  for (std::size_t i = 0; i < num_images; ++i) {
    auto record = evaluate_image(samples[i]);
    if (!record) return std::unexpected(record.error());
    records.push_back(std::move(*record));

    if (i % kProgressInterval == 0 && i != 0) {
      std::cout << "Images processed: " << i << "\n";
    }
  }

  EvaluationReport report = score(records);
  if (config_.visualize) {
    const std::size_t written = visualize(records);
    std::cout << "Wrote " << written << " annotated images to " << config_.output_dir << "\n";
  }
  return report;
}

EvaluationReport EvaluationDriver::score(const std::vector<ImageRecord>& records) const {
  std::vector<std::vector<core::LabeledBox>> ground_truth;
  std::vector<eval::ImagePredictions> predictions;
  split_records(records, ground_truth, predictions);

  const eval::GroundTruthExpander expander(mapper_);
  const eval::PredictionAssembler assembler(mapper_, mapper_.num_classes());
  auto all_gt = expander.expand(ground_truth);
  const auto all_boxes = assembler.assemble(predictions);

  eval::ApOptions options;
  options.metric = config_.use_07_metric ? eval::ApMetric::Voc07ElevenPoint
                                         : eval::ApMetric::Continuous;
  options.iou_threshold = config_.iou_threshold;

  EvaluationReport report;
  report.class_names = mapper_.all_classes();
  report.num_images = records.size();
  report.aps = eval::evaluate_detections(all_boxes, all_gt, report.class_names, options);

  std::vector<double> ap_list;
  for (std::size_t c = 1; c < report.class_names.size(); ++c) {
    ap_list.push_back(report.aps.at(report.class_names[c]));
  }
  report.mean_ap = eval::nan_mean(ap_list);
  return report;
}

std::size_t EvaluationDriver::visualize(const std::vector<ImageRecord>& records) const {
  std::vector<std::vector<core::LabeledBox>> ground_truth;
  std::vector<eval::ImagePredictions> predictions;
  split_records(records, ground_truth, predictions);
  const auto all_gt = eval::GroundTruthExpander(mapper_).expand(ground_truth);
  const auto all_boxes =
      eval::PredictionAssembler(mapper_, mapper_.num_classes()).assemble(predictions);
  const auto& classes = mapper_.all_classes();

  const std::filesystem::path out_dir(config_.output_dir);
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << "Warning: could not create " << out_dir << ": " << ec.message() << "\n";
    return 0;
  }

  std::size_t written = 0;
  for (std::size_t img = 0; img < records.size(); ++img) {
    const auto& record = records[img];
    if (record.display.empty()) continue;

    const auto to_original = [&record](const core::Box& box) {
      return eval::to_original_image_coordinates(box, record.dims.original(), record.dims.input());
    };
    core::Frame gt_image = record.display;
    core::Frame pred_image = record.display;
    for (std::size_t c = 1; c < classes.size(); ++c) {
      std::vector<core::Box> boxes;
      for (const auto& box : all_gt.at(classes[c])[img].boxes) boxes.push_back(to_original(box));
      vision::draw_boxes(gt_image, boxes, classes[c]);

      boxes.clear();
      for (const auto& d : all_boxes[c][img]) boxes.push_back(to_original(d.box));
      vision::draw_boxes(pred_image, boxes, classes[c]);
    }

    const std::string stem = std::filesystem::path(record.image_path).stem().string();
    for (const auto& [image, suffix] : {std::pair{&gt_image, "_gt.png"},
                                        std::pair{&pred_image, "_pred.png"}}) {
      const auto file = out_dir / (stem + suffix);
      if (vision::save_frame_to_image(*image, file.string())) {
        ++written;
      } else {
        std::cerr << "Warning: could not write " << file << "\n";
      }
    }
  }
  return written;
}

void print_report(const EvaluationReport& report, std::ostream& out) {
  const auto flags = out.flags();
  const auto precision = out.precision();
  out << std::fixed << std::setprecision(6);
  for (std::size_t c = 1; c < report.class_names.size(); ++c) {
    const auto& name = report.class_names[c];
    out << "AP for " << std::setw(15) << std::right << name << " = " << report.aps.at(name)
        << "\n";
  }
  out << "Mean AP = " << report.mean_ap << "\n";
  out.flags(flags);
  out.precision(precision);
}

}  // namespace hiereval::app
