#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace hiereval::hierarchy {

/// Name of the class at index 0 in every class table.
inline constexpr std::string_view kBackgroundClass = "__background__";

/// Bijection between class names and contiguous indices 0..size()-1.
/// Construction throws std::runtime_error on empty or duplicate names.
class ClassTable {
 public:
  ClassTable() = default;
  explicit ClassTable(std::vector<std::string> names);

  /// Builds a table from (name, index) pairs in any order. Indices must cover
  /// 0..n-1 exactly once.
  [[nodiscard]] static ClassTable from_entries(
      const std::vector<std::pair<std::string, int>>& entries);

  [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
  [[nodiscard]] bool empty() const noexcept { return names_.empty(); }

  /// Throws std::out_of_range for an invalid index.
  [[nodiscard]] const std::string& name(std::size_t index) const;
  [[nodiscard]] std::optional<std::size_t> index_of(std::string_view name) const;
  [[nodiscard]] bool contains(std::string_view name) const {
    return index_of(name).has_value();
  }

  [[nodiscard]] const std::vector<std::string>& names() const noexcept {
    return names_;
  }

 private:
  std::vector<std::string> names_;
  std::unordered_map<std::string, std::size_t> index_;
};

/// Loads a class map file: one "name<TAB>index" (or space separated) entry per line.
/// Throws std::runtime_error if the file cannot be read or is malformed.
[[nodiscard]] ClassTable load_class_map(const std::string& path);

}  // namespace hiereval::hierarchy
