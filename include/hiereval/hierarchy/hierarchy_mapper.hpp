#pragma once

#include <hiereval/hierarchy/class_table.hpp>
#include <hiereval/hierarchy/class_tree.hpp>
#include <cstddef>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace hiereval::hierarchy {

/// One score per class slot. Raw vectors follow the network output layout
/// (raw_size() entries); reduced vectors follow the mapped class table
/// (num_classes() entries, index 0 = background).
using ClassVector = std::vector<float>;

/// Training target for one original label.
struct LabelVectors {
  ClassVector train;  // 1 at every slot on the label's path, incl. its own group background
  ClassVector aux;    // 1 at every slot of every softmax group the path touches
};

/// Maps between the dataset's flat labels, the hierarchical network output and the
/// mapped class space used for evaluation.
///
/// Network layout: every internal node, the implicit root included, owns one softmax
/// group `[background, child_1, ..., child_k]`. Groups are laid out root first, then in
/// tree pre-order. The root group's background is `__background__`; the background of
/// any other group means "this node, none of its children" and is dropped by
/// reduce_vector().
///
/// Mapped class space: `__background__` followed by all tree nodes in pre-order.
///
/// Construct once and pass by reference to every component that needs it.
class HierarchyMapper {
 public:
  /// \param dataset_classes Original class map; index 0 must be `__background__` and
  ///        every other class must appear in the tree.
  /// Throws std::runtime_error if the class map and tree disagree.
  HierarchyMapper(ClassTable dataset_classes, ClassTree tree);

  [[nodiscard]] std::size_t raw_size() const noexcept { return raw_size_; }
  [[nodiscard]] std::size_t num_classes() const noexcept { return mapped_classes_.size(); }

  /// Mapped class names, index 0 = `__background__`.
  [[nodiscard]] const std::vector<std::string>& all_classes() const noexcept {
    return mapped_classes_.names();
  }
  [[nodiscard]] const ClassTable& mapped_classes() const noexcept { return mapped_classes_; }
  [[nodiscard]] const ClassTable& dataset_classes() const noexcept { return dataset_classes_; }
  [[nodiscard]] const ClassTree& tree() const noexcept { return tree_; }

  /// Name of an original dataset label. Throws std::out_of_range for unknown labels.
  [[nodiscard]] const std::string& original_class_name(int label) const;

  /// Throws std::out_of_range for unknown labels.
  [[nodiscard]] LabelVectors vectors_for_label(int label) const;

  /// Raw layout -> mapped class space.
  /// Throws core::HierarchyConsistencyError if `raw` has the wrong length.
  [[nodiscard]] ClassVector reduce_vector(std::span<const float> raw) const;

  /// Greedy top-down decoding in raw layout: from the root group, follow the
  /// highest-scoring slot of each group, multiplying conditional scores along the
  /// way, until a group background or a leaf is chosen. Slots off that path are 0,
  /// so a child's score never exceeds its parent's.
  /// Throws core::HierarchyConsistencyError if `raw` has the wrong length.
  [[nodiscard]] ClassVector top_down_decode(std::span<const float> raw) const;

  /// Mapped index of the deepest node on the top_down_decode() path: the leaf it ends
  /// in, or the node whose group background stopped it. 0 if the root background wins.
  /// Throws core::HierarchyConsistencyError if `raw` has the wrong length.
  [[nodiscard]] std::size_t top_down_class(std::span<const float> raw) const;

  void print_tree(std::ostream& out) const { tree_.print(out); }

 private:
  struct Group {
    std::size_t offset{0};
    std::vector<int> children;
  };

  void check_raw_size(std::span<const float> raw, const char* what) const;
  void mark_group(ClassVector& v, const Group& group) const;
  std::size_t best_slot(std::span<const float> raw, const Group& group) const;

  ClassTable dataset_classes_;
  ClassTree tree_;
  ClassTable mapped_classes_;
  std::vector<Group> groups_;
  std::vector<std::size_t> node_slot_;  // raw slot of each tree node in its parent's group
  std::vector<int> node_group_;         // group owned by each tree node, -1 for leaves
  std::vector<int> parent_group_;       // group each tree node belongs to
  std::size_t raw_size_{0};
};

}  // namespace hiereval::hierarchy
