#include "vkr/depends.h"

#include <set>

#include "gtest/gtest.h"
#include "vbg/error.h"

namespace {

bool eval(const std::string& text, std::set<std::string> kept) {
  return vkr::DependsExpr::parse(text, "test").evaluate(
      [&](const std::string& name) { return kept.count(name) != 0; });
}

TEST(DependsExprTest, Empty) {
  EXPECT_TRUE(eval("", {}));
  EXPECT_TRUE(eval("  ", {}));
}

TEST(DependsExprTest, Name) {
  EXPECT_TRUE(eval("VK_KHR_surface", {"VK_KHR_surface"}));
  EXPECT_FALSE(eval("VK_KHR_surface", {}));
}

TEST(DependsExprTest, Conjunction) {
  EXPECT_TRUE(eval("A+B", {"A", "B"}));
  EXPECT_FALSE(eval("A+B", {"A"}));
}

TEST(DependsExprTest, Disjunction) {
  EXPECT_TRUE(eval("A,B", {"B"}));
  EXPECT_FALSE(eval("A,B", {}));
}

TEST(DependsExprTest, LeftToRight) {
  // (A,B)+C
  EXPECT_FALSE(eval("A,B+C", {"A"}));
  EXPECT_TRUE(eval("A,B+C", {"A", "C"}));
  // (A+B),C
  EXPECT_TRUE(eval("A+B,C", {"C"}));
}

TEST(DependsExprTest, Parentheses) {
  const std::string text =
      "VK_KHR_get_physical_device_properties2+(VK_KHR_x,VK_VERSION_1_1)";
  EXPECT_TRUE(eval(text, {"VK_KHR_get_physical_device_properties2",
                          "VK_VERSION_1_1"}));
  EXPECT_FALSE(eval(text, {"VK_VERSION_1_1"}));
  EXPECT_TRUE(eval(text, {"VK_KHR_get_physical_device_properties2",
                          "VK_KHR_x"}));
}

TEST(DependsExprTest, Malformed) {
  EXPECT_THROW(vkr::DependsExpr::parse("A+", "test"), vbg::malformed_registry);
  EXPECT_THROW(vkr::DependsExpr::parse("(A,B", "test"),
               vbg::malformed_registry);
  EXPECT_THROW(vkr::DependsExpr::parse("A B", "test"), vbg::malformed_registry);
  EXPECT_THROW(vkr::DependsExpr::parse("A)", "test"), vbg::malformed_registry);
}

TEST(DependsExprTest, LegacyRequires) {
  EXPECT_EQ(vkr::requires_to_depends("VK_KHR_surface,VK_KHR_swapchain"),
            "VK_KHR_surface+VK_KHR_swapchain");
  EXPECT_EQ(vkr::requires_to_depends(""), "");
}

}  // namespace
