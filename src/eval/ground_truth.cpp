#include <hiereval/eval/ground_truth.hpp>
#include <hiereval/core/error.hpp>

namespace hiereval::eval {

std::vector<core::LabeledBox> GroundTruthExpander::expand_box(const core::LabeledBox& gt) const {
  const auto vectors = mapper_.vectors_for_label(gt.label);
  const auto reduced = mapper_.reduce_vector(vectors.train);
  const std::string& original_name = mapper_.original_class_name(gt.label);
  const auto& classes = mapper_.all_classes();

  std::vector<core::LabeledBox> derived;
  bool found_original = false;
  for (std::size_t i = 1; i < reduced.size(); ++i) {
    if (reduced[i] == 0.f) continue;
    if (classes[i] == original_name) found_original = true;
    derived.push_back({gt.box, static_cast<int>(i)});
  }

  if (!found_original) {
    throw core::HierarchyConsistencyError("Original class '" + original_name +
                                          "' is not contained in its mapped selection");
  }
  return derived;
}

PerClassGroundTruth GroundTruthExpander::expand(
    const std::vector<std::vector<core::LabeledBox>>& images) const {
  const auto& classes = mapper_.all_classes();

  PerClassGroundTruth out;
  for (std::size_t c = 1; c < classes.size(); ++c) {
    out[classes[c]].resize(images.size());
  }

  for (std::size_t img = 0; img < images.size(); ++img) {
    for (const auto& gt : images[img]) {
      for (const auto& derived : expand_box(gt)) {
        auto& record = out[classes[static_cast<std::size_t>(derived.label)]][img];
        record.boxes.push_back(derived.box);
        record.difficult.push_back(false);
        record.detected.push_back(false);
      }
    }
  }
  return out;
}

}  // namespace hiereval::eval
