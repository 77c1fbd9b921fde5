#include <hiereval/hierarchy/class_table.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace hh = hiereval::hierarchy;

TEST(ClassTable, LooksUpBothWays) {
  const hh::ClassTable t({"__background__", "avocado", "orange"});
  EXPECT_EQ(t.size(), 3u);
  EXPECT_EQ(t.name(1), "avocado");
  ASSERT_TRUE(t.index_of("orange").has_value());
  EXPECT_EQ(*t.index_of("orange"), 2u);
  EXPECT_FALSE(t.contains("tomato"));
  EXPECT_THROW((void)t.name(3), std::out_of_range);
}

TEST(ClassTable, RejectsDuplicateAndEmptyNames) {
  EXPECT_THROW(hh::ClassTable({"a", "b", "a"}), std::runtime_error);
  EXPECT_THROW(hh::ClassTable({"a", ""}), std::runtime_error);
}

TEST(ClassTable, FromEntriesOrdersByIndex) {
  const auto t = hh::ClassTable::from_entries({{"b", 1}, {"__background__", 0}, {"c", 2}});
  EXPECT_EQ(t.names(), (std::vector<std::string>{"__background__", "b", "c"}));

  EXPECT_THROW((void)hh::ClassTable::from_entries({{"a", 0}, {"b", 0}}), std::runtime_error);
  EXPECT_THROW((void)hh::ClassTable::from_entries({{"a", 0}, {"b", 5}}), std::runtime_error);
}

TEST(ClassTable, LoadClassMap) {
  const auto path = std::filesystem::temp_directory_path() / "hiereval_class_map_test.txt";
  {
    std::ofstream f(path);
    f << "# grocery\n__background__\t0\nmilk\t2\n\nbutter\t1\n";
  }
  const auto t = hh::load_class_map(path.string());
  EXPECT_EQ(t.size(), 3u);
  EXPECT_EQ(t.name(1), "butter");
  EXPECT_EQ(t.name(2), "milk");

  {
    std::ofstream f(path);
    f << "__background__\t0\nmilk\n";
  }
  EXPECT_THROW((void)hh::load_class_map(path.string()), std::runtime_error);
  std::filesystem::remove(path);

  EXPECT_THROW((void)hh::load_class_map("/nonexistent/class_map.txt"), std::runtime_error);
}
