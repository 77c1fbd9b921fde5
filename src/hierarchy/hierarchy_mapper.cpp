#include <hiereval/hierarchy/hierarchy_mapper.hpp>
#include <hiereval/core/error.hpp>
#include <stdexcept>

namespace hiereval::hierarchy {

namespace {

std::vector<std::string> mapped_names(const ClassTree& tree) {
  std::vector<std::string> names;
  names.reserve(tree.size() + 1);
  names.emplace_back(kBackgroundClass);
  for (const auto& n : tree.nodes()) names.push_back(n.name);
  return names;
}

}  // namespace

HierarchyMapper::HierarchyMapper(ClassTable dataset_classes, ClassTree tree)
    : dataset_classes_(std::move(dataset_classes)),
      tree_(std::move(tree)),
      mapped_classes_(mapped_names(tree_)) {
  if (dataset_classes_.empty() || dataset_classes_.name(0) != kBackgroundClass) {
    throw std::runtime_error("HierarchyMapper: class map must start with __background__ at index 0");
  }
  for (std::size_t i = 1; i < dataset_classes_.size(); ++i) {
    if (!mapped_classes_.contains(dataset_classes_.name(i))) {
      throw std::runtime_error("HierarchyMapper: class '" + dataset_classes_.name(i) +
                               "' is not part of the hierarchy");
    }
  }

  node_slot_.assign(tree_.size(), 0);
  node_group_.assign(tree_.size(), -1);
  parent_group_.assign(tree_.size(), 0);

  Group root;
  root.children = tree_.roots();
  groups_.push_back(std::move(root));
  for (std::size_t n = 0; n < tree_.size(); ++n) {
    const auto& node = tree_.node(n);
    if (node.is_leaf()) continue;
    node_group_[n] = static_cast<int>(groups_.size());
    Group g;
    g.children = node.children;
    groups_.push_back(std::move(g));
  }

  for (std::size_t gi = 0; gi < groups_.size(); ++gi) {
    auto& g = groups_[gi];
    g.offset = raw_size_;
    for (std::size_t k = 0; k < g.children.size(); ++k) {
      const auto child = static_cast<std::size_t>(g.children[k]);
      node_slot_[child] = g.offset + 1 + k;
      parent_group_[child] = static_cast<int>(gi);
    }
    raw_size_ += g.children.size() + 1;
  }
}

const std::string& HierarchyMapper::original_class_name(int label) const {
  if (label < 0) {
    throw std::out_of_range("HierarchyMapper: negative label " + std::to_string(label));
  }
  return dataset_classes_.name(static_cast<std::size_t>(label));
}

void HierarchyMapper::mark_group(ClassVector& v, const Group& group) const {
  for (std::size_t s = 0; s <= group.children.size(); ++s) v[group.offset + s] = 1.f;
}

LabelVectors HierarchyMapper::vectors_for_label(int label) const {
  const std::string& name = original_class_name(label);

  LabelVectors out;
  out.train.assign(raw_size_, 0.f);
  out.aux.assign(raw_size_, 0.f);

  if (label == 0) {
    out.train[groups_[0].offset] = 1.f;
    mark_group(out.aux, groups_[0]);
    return out;
  }

  const int node = *tree_.find(name);
  for (const int n : tree_.path_to(node)) {
    const auto un = static_cast<std::size_t>(n);
    out.train[node_slot_[un]] = 1.f;
    mark_group(out.aux, groups_[static_cast<std::size_t>(parent_group_[un])]);
  }
  if (const int own = node_group_[static_cast<std::size_t>(node)]; own >= 0) {
    const auto& g = groups_[static_cast<std::size_t>(own)];
    out.train[g.offset] = 1.f;
    mark_group(out.aux, g);
  }
  return out;
}

void HierarchyMapper::check_raw_size(std::span<const float> raw, const char* what) const {
  if (raw.size() != raw_size_) {
    throw core::HierarchyConsistencyError(
        std::string("HierarchyMapper::") + what + ": vector has " + std::to_string(raw.size()) +
        " entries, hierarchy expects " + std::to_string(raw_size_));
  }
}

ClassVector HierarchyMapper::reduce_vector(std::span<const float> raw) const {
  check_raw_size(raw, "reduce_vector");
  ClassVector reduced(num_classes(), 0.f);
  reduced[0] = raw[groups_[0].offset];
  for (std::size_t n = 0; n < tree_.size(); ++n) {
    reduced[n + 1] = raw[node_slot_[n]];
  }
  return reduced;
}

std::size_t HierarchyMapper::best_slot(std::span<const float> raw, const Group& group) const {
  std::size_t best = group.offset;  // ties go to the group background
  for (std::size_t s = group.offset + 1; s <= group.offset + group.children.size(); ++s) {
    if (raw[s] > raw[best]) best = s;
  }
  return best;
}

ClassVector HierarchyMapper::top_down_decode(std::span<const float> raw) const {
  check_raw_size(raw, "top_down_decode");
  ClassVector out(raw_size_, 0.f);

  float p = 1.f;
  const Group* g = &groups_[0];
  while (true) {
    const std::size_t best = best_slot(raw, *g);
    p *= raw[best];
    out[best] = p;
    if (best == g->offset) break;

    const auto child = static_cast<std::size_t>(g->children[best - g->offset - 1]);
    const int next = node_group_[child];
    if (next < 0) break;
    g = &groups_[static_cast<std::size_t>(next)];
  }
  return out;
}

std::size_t HierarchyMapper::top_down_class(std::span<const float> raw) const {
  check_raw_size(raw, "top_down_class");
  std::size_t label = 0;
  const Group* g = &groups_[0];
  while (true) {
    const std::size_t best = best_slot(raw, *g);
    if (best == g->offset) break;

    const auto child = static_cast<std::size_t>(g->children[best - g->offset - 1]);
    label = child + 1;  // mapped index = pre-order node index + 1
    const int next = node_group_[child];
    if (next < 0) break;
    g = &groups_[static_cast<std::size_t>(next)];
  }
  return label;
}

}  // namespace hiereval::hierarchy
