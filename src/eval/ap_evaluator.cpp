#include <hiereval/eval/ap_evaluator.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace hiereval::eval {

namespace {

constexpr int kElevenPoints = 11;

struct RankedDetection {
  std::size_t image{0};
  const Detection* detection{nullptr};
};

}  // namespace

double average_precision(std::span<const double> recall,
                         std::span<const double> precision,
                         ApMetric metric) {
  if (recall.size() != precision.size()) {
    throw std::invalid_argument("average_precision: recall and precision differ in length");
  }

  if (metric == ApMetric::Voc07ElevenPoint) {
    double ap = 0.0;
    for (int point = 0; point < kElevenPoints; ++point) {
      const double threshold = point / 10.0;
      double max_precision = 0.0;
      for (std::size_t i = 0; i < recall.size(); ++i) {
        if (recall[i] >= threshold && precision[i] > max_precision) {
          max_precision = precision[i];
        }
      }
      ap += max_precision / kElevenPoints;
    }
    return ap;
  }

  // Sentinels at both ends, then the precision envelope from the right.
  std::vector<double> mrec;
  std::vector<double> mpre;
  mrec.reserve(recall.size() + 2);
  mpre.reserve(precision.size() + 2);
  mrec.push_back(0.0);
  mpre.push_back(0.0);
  mrec.insert(mrec.end(), recall.begin(), recall.end());
  mpre.insert(mpre.end(), precision.begin(), precision.end());
  mrec.push_back(1.0);
  mpre.push_back(0.0);

  for (std::size_t i = mpre.size() - 1; i > 0; --i) {
    mpre[i - 1] = std::max(mpre[i - 1], mpre[i]);
  }

  double ap = 0.0;
  for (std::size_t i = 1; i < mrec.size(); ++i) {
    if (mrec[i] != mrec[i - 1]) {
      ap += (mrec[i] - mrec[i - 1]) * mpre[i];
    }
  }
  return ap;
}

double evaluate_class(const std::vector<std::vector<Detection>>& detections,
                      std::vector<GroundTruthRecord>& ground_truth,
                      const ApOptions& options) {
  if (detections.size() != ground_truth.size()) {
    throw std::invalid_argument("evaluate_class: " + std::to_string(detections.size()) +
                                " detection lists but " + std::to_string(ground_truth.size()) +
                                " ground-truth records");
  }

  std::size_t num_positives = 0;
  for (auto& record : ground_truth) {
    record.detected.assign(record.boxes.size(), false);
    record.difficult.resize(record.boxes.size(), false);
    num_positives += static_cast<std::size_t>(
        std::count(record.difficult.begin(), record.difficult.end(), false));
  }
  if (num_positives == 0) {
    return std::numeric_limits<double>::quiet_NaN();
  }

  std::vector<RankedDetection> ranked;
  for (std::size_t img = 0; img < detections.size(); ++img) {
    for (const auto& d : detections[img]) ranked.push_back({img, &d});
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedDetection& a, const RankedDetection& b) {
                     return a.detection->score > b.detection->score;
                   });

  std::vector<double> recall;
  std::vector<double> precision;
  recall.reserve(ranked.size());
  precision.reserve(ranked.size());
  std::size_t tp = 0;
  std::size_t fp = 0;

  for (const auto& r : ranked) {
    auto& record = ground_truth[r.image];
    float best_iou = 0.f;
    std::size_t best = record.boxes.size();
    for (std::size_t g = 0; g < record.boxes.size(); ++g) {
      const float iou = core::intersection_over_union(r.detection->box, record.boxes[g]);
      if (iou > best_iou) {
        best_iou = iou;
        best = g;
      }
    }

    if (best < record.boxes.size() && best_iou > options.iou_threshold) {
      if (record.difficult[best]) {
        continue;  // neither true nor false positive
      }
      if (!record.detected[best]) {
        record.detected[best] = true;
        ++tp;
      } else {
        ++fp;
      }
    } else {
      ++fp;
    }

    recall.push_back(static_cast<double>(tp) / static_cast<double>(num_positives));
    precision.push_back(static_cast<double>(tp) / static_cast<double>(tp + fp));
  }

  return average_precision(recall, precision, options.metric);
}

ApByClass evaluate_detections(const PerClassDetections& detections,
                              PerClassGroundTruth& ground_truth,
                              const std::vector<std::string>& class_names,
                              const ApOptions& options) {
  if (detections.size() != class_names.size()) {
    throw std::invalid_argument("evaluate_detections: detections cover " +
                                std::to_string(detections.size()) + " classes, expected " +
                                std::to_string(class_names.size()));
  }

  ApByClass aps;
  for (std::size_t c = 1; c < class_names.size(); ++c) {
    const auto it = ground_truth.find(class_names[c]);
    if (it == ground_truth.end()) {
      throw std::invalid_argument("evaluate_detections: no ground truth entry for class '" +
                                  class_names[c] + "'");
    }
    aps[class_names[c]] = evaluate_class(detections[c], it->second, options);
  }
  return aps;
}

double nan_mean(std::span<const double> values) noexcept {
  double sum = 0.0;
  std::size_t n = 0;
  for (const double v : values) {
    if (std::isnan(v)) continue;
    sum += v;
    ++n;
  }
  return n > 0 ? sum / static_cast<double>(n) : std::numeric_limits<double>::quiet_NaN();
}

}  // namespace hiereval::eval
