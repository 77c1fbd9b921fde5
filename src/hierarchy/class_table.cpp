#include <hiereval/hierarchy/class_table.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace hiereval::hierarchy {

ClassTable::ClassTable(std::vector<std::string> names) : names_(std::move(names)) {
  index_.reserve(names_.size());
  for (std::size_t i = 0; i < names_.size(); ++i) {
    if (names_[i].empty()) {
      throw std::runtime_error("ClassTable: empty class name at index " + std::to_string(i));
    }
    const auto [it, inserted] = index_.emplace(names_[i], i);
    if (!inserted) {
      throw std::runtime_error("ClassTable: duplicate class name '" + names_[i] +
                               "' at indices " + std::to_string(it->second) + " and " +
                               std::to_string(i));
    }
  }
}

ClassTable ClassTable::from_entries(
    const std::vector<std::pair<std::string, int>>& entries) {
  std::vector<std::string> names(entries.size());
  std::vector<bool> seen(entries.size(), false);
  for (const auto& [name, index] : entries) {
    if (index < 0 || static_cast<std::size_t>(index) >= entries.size()) {
      throw std::runtime_error("ClassTable: index " + std::to_string(index) + " of '" + name +
                               "' outside 0.." + std::to_string(entries.size() - 1));
    }
    const auto i = static_cast<std::size_t>(index);
    if (seen[i]) {
      throw std::runtime_error("ClassTable: index " + std::to_string(index) +
                               " assigned twice");
    }
    seen[i] = true;
    names[i] = name;
  }
  return ClassTable(std::move(names));
}

const std::string& ClassTable::name(std::size_t index) const {
  if (index >= names_.size()) {
    throw std::out_of_range("ClassTable: no class at index " + std::to_string(index));
  }
  return names_[index];
}

std::optional<std::size_t> ClassTable::index_of(std::string_view name) const {
  const auto it = index_.find(std::string(name));
  if (it == index_.end()) return std::nullopt;
  return it->second;
}

ClassTable load_class_map(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("load_class_map: cannot open " + path);
  }

  std::vector<std::pair<std::string, int>> entries;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    std::istringstream in(line);
    std::string name;
    int index = -1;
    if (!(in >> name)) continue;  // blank line
    if (name[0] == '#') continue;
    if (!(in >> index)) {
      throw std::runtime_error("load_class_map: " + path + ":" + std::to_string(line_no) +
                               ": expected '<name> <index>'");
    }
    entries.emplace_back(std::move(name), index);
  }
  return ClassTable::from_entries(entries);
}

}  // namespace hiereval::hierarchy
