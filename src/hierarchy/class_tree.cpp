#include <hiereval/hierarchy/class_tree.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hiereval::hierarchy {

namespace {

constexpr std::size_t kIndentWidth = 2;

std::runtime_error parse_error(std::size_t line_no, const std::string& what) {
  return std::runtime_error("ClassTree: line " + std::to_string(line_no) + ": " + what);
}

}  // namespace

ClassTree ClassTree::parse(std::string_view text) {
  ClassTree tree;
  std::vector<int> open;  // open[d] = last node seen at depth d

  std::istringstream in{std::string(text)};
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();

    const auto start = line.find_first_not_of(' ');
    if (start == std::string::npos) continue;
    if (line[start] == '#') continue;
    if (line[start] == '\t') throw parse_error(line_no, "tabs are not allowed for indentation");
    if (start % kIndentWidth != 0) {
      throw parse_error(line_no, "indentation must be a multiple of two spaces");
    }

    const auto end = line.find_last_not_of(" \t");
    std::string name = line.substr(start, end - start + 1);
    if (name.find_first_of(" \t") != std::string::npos) {
      throw parse_error(line_no, "class names must not contain whitespace");
    }

    const auto depth = static_cast<int>(start / kIndentWidth);
    if (depth > static_cast<int>(open.size())) {
      throw parse_error(line_no, "'" + name + "' is indented more than one level below its parent");
    }
    if (tree.find(name)) {
      throw parse_error(line_no, "duplicate class '" + name + "'");
    }

    const int index = static_cast<int>(tree.nodes_.size());
    TreeNode node;
    node.name = std::move(name);
    node.depth = depth;
    node.parent = depth == 0 ? -1 : open[static_cast<std::size_t>(depth - 1)];
    tree.nodes_.push_back(std::move(node));

    if (depth == 0) {
      tree.roots_.push_back(index);
    } else {
      tree.nodes_[static_cast<std::size_t>(tree.nodes_.back().parent)].children.push_back(index);
    }
    open.resize(static_cast<std::size_t>(depth));
    open.push_back(index);
  }

  if (tree.nodes_.empty()) {
    throw std::runtime_error("ClassTree: no classes defined");
  }
  return tree;
}

std::optional<int> ClassTree::find(std::string_view name) const {
  const auto it = std::find_if(nodes_.begin(), nodes_.end(),
                               [name](const TreeNode& n) { return n.name == name; });
  if (it == nodes_.end()) return std::nullopt;
  return static_cast<int>(it - nodes_.begin());
}

std::vector<int> ClassTree::path_to(int index) const {
  std::vector<int> path;
  for (int i = index; i >= 0; i = nodes_.at(static_cast<std::size_t>(i)).parent) {
    path.push_back(i);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

void ClassTree::print(std::ostream& out) const {
  out << "(root)\n";
  for (const auto& n : nodes_) {
    out << std::string(kIndentWidth * static_cast<std::size_t>(n.depth + 1), ' ') << n.name
        << "\n";
  }
}

ClassTree load_class_tree(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("load_class_tree: cannot open " + path);
  }
  std::ostringstream text;
  text << f.rdbuf();
  return ClassTree::parse(text.str());
}

}  // namespace hiereval::hierarchy
