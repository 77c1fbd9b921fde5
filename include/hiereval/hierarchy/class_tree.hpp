#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace hiereval::hierarchy {

struct TreeNode {
  std::string name;
  int parent{-1};  // -1: child of the implicit root
  int depth{0};
  std::vector<int> children;

  [[nodiscard]] bool is_leaf() const noexcept { return children.empty(); }
};

/// Class hierarchy. Nodes are stored in pre-order; the root is implicit.
///
/// Text format: one class name per line, two spaces of indentation per level,
/// '#' starts a comment line:
///
///   food
///     fruit
///       orange
///     vegetable
///       tomato
class ClassTree {
 public:
  /// Throws std::runtime_error on bad indentation or duplicate names.
  [[nodiscard]] static ClassTree parse(std::string_view text);

  [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }
  [[nodiscard]] const TreeNode& node(std::size_t index) const { return nodes_.at(index); }
  [[nodiscard]] const std::vector<TreeNode>& nodes() const noexcept { return nodes_; }

  /// Top-level classes (children of the implicit root), in file order.
  [[nodiscard]] const std::vector<int>& roots() const noexcept { return roots_; }

  [[nodiscard]] std::optional<int> find(std::string_view name) const;

  /// Node indices from the top-level ancestor down to `index` (inclusive).
  [[nodiscard]] std::vector<int> path_to(int index) const;

  void print(std::ostream& out) const;

 private:
  std::vector<TreeNode> nodes_;
  std::vector<int> roots_;
};

/// Throws std::runtime_error if the file cannot be read or parsed.
[[nodiscard]] ClassTree load_class_tree(const std::string& path);

}  // namespace hiereval::hierarchy
