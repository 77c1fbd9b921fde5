#include <hiereval/eval/prediction_assembler.hpp>
#include <hiereval/core/error.hpp>
#include <stdexcept>
#include <string>

namespace hiereval::eval {

std::vector<LabeledDetection> PredictionAssembler::assemble_region(std::span<const float> raw,
                                                                   const core::Box& roi) const {
  const auto decoded = mapper_.top_down_decode(raw);
  const auto reduced = mapper_.reduce_vector(decoded);
  if (reduced.size() != num_classes_) {
    throw core::HierarchyConsistencyError(
        "Reduced prediction vector has " + std::to_string(reduced.size()) +
        " entries, expected " + std::to_string(num_classes_) + " classes");
  }

  std::vector<LabeledDetection> out;
  for (std::size_t label = 1; label < reduced.size(); ++label) {
    if (reduced[label] == 0.f) continue;
    out.push_back({Detection{roi, reduced[label]}, static_cast<int>(label)});
  }
  return out;
}

PerClassDetections PredictionAssembler::assemble(const std::vector<ImagePredictions>& images) const {
  PerClassDetections all(num_classes_,
                         std::vector<std::vector<Detection>>(images.size()));

  for (std::size_t img = 0; img < images.size(); ++img) {
    const auto& image = images[img];
    if (image.raw_outputs.size() != image.rois.size()) {
      throw std::invalid_argument("PredictionAssembler: image " + std::to_string(img) + " has " +
                                  std::to_string(image.raw_outputs.size()) + " outputs but " +
                                  std::to_string(image.rois.size()) + " rois");
    }
    for (std::size_t r = 0; r < image.rois.size(); ++r) {
      for (const auto& d : assemble_region(image.raw_outputs[r], image.rois[r])) {
        all[static_cast<std::size_t>(d.label)][img].push_back(d.detection);
      }
    }
  }
  return all;
}

}  // namespace hiereval::eval
