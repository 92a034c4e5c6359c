#pragma once

#include <functional>
#include <memory>
#include <string>

namespace vkr {

// A registry dependency expression such as
// "VK_KHR_surface+(VK_KHR_get_surface_capabilities2,VK_VERSION_1_1)".
// '+' is conjunction, ',' is disjunction; both associate left to right with
// equal precedence and parentheses group.
class DependsExpr {
 public:
  // Throws vbg::malformed_registry. An empty text is always satisfied.
  static DependsExpr parse(const std::string& text, const std::string& location);

  DependsExpr(DependsExpr&&);
  DependsExpr& operator=(DependsExpr&&);
  ~DependsExpr();

  bool evaluate(const std::function<bool(const std::string&)>& holds) const;

  struct Node;

 private:
  DependsExpr();
  std::unique_ptr<Node> root_;
};

// "A,B" from a legacy requires attribute becomes "A+B".
std::string requires_to_depends(const std::string& requires_list);

}  // namespace vkr
