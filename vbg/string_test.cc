#include "vbg/string.h"

#include "gtest/gtest.h"

namespace {

TEST(StringTest, Split) {
  EXPECT_EQ(vbg::split(",", "a,b,,c"),
            (std::vector<std::string>{"a", "b", "", "c"}));
  EXPECT_EQ(vbg::split(",", ""), (std::vector<std::string>{""}));
  EXPECT_EQ(vbg::split_nonempty(",", "a,b,,c"),
            (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_TRUE(vbg::split_nonempty(",", "").empty());
}

TEST(StringTest, Join) {
  EXPECT_EQ(vbg::join(" -> ", std::vector<std::string>{"A", "B", "A"}),
            "A -> B -> A");
  EXPECT_EQ(vbg::join(",", std::vector<std::string>{}), "");
}

TEST(StringTest, Affixes) {
  static_assert(vbg::startswith("VK_KHR_surface", "VK_"));
  static_assert(!vbg::startswith("VK", "VK_"));
  static_assert(vbg::endswith("VkFooKHR", "KHR"));
  static_assert(!vbg::endswith("KHR", "VkKHR"));
}

TEST(StringTest, Whitespace) {
  EXPECT_EQ(vbg::trim("  const char*\n"), "const char*");
  EXPECT_EQ(vbg::trim(" \t "), "");
  EXPECT_EQ(vbg::squeeze("typedef  void\n  (VKAPI_PTR *PFN)"),
            "typedef void (VKAPI_PTR *PFN)");
}

}  // namespace
