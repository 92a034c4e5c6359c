#include "vkr/depends.h"

#include <cctype>

#include "vbg/scanner.h"
#include "vbg/string.h"

namespace vkr {

struct DependsExpr::Node {
  enum Op { NAME, AND, OR };
  Op op = NAME;
  std::string name;
  std::unique_ptr<Node> lhs;
  std::unique_ptr<Node> rhs;

  bool evaluate(const std::function<bool(const std::string&)>& holds) const {
    switch (op) {
      case NAME:
        return holds(name);
      case AND:
        return lhs->evaluate(holds) && rhs->evaluate(holds);
      case OR:
        return lhs->evaluate(holds) || rhs->evaluate(holds);
    }
    return false;
  }
};

namespace {

class DependsParser : vbg::scanner {
 public:
  using vbg::scanner::scanner;

  std::unique_ptr<DependsExpr::Node> parse_all() {
    auto node = parse_sequence();
    skip_whitespace();
    if (peek() != eof) fail("unexpected '", peek(), "'");
    return node;
  }

 private:
  void skip_whitespace() {
    while (std::isspace((unsigned char)peek())) incr();
  }

  std::unique_ptr<DependsExpr::Node> parse_sequence() {
    auto lhs = parse_primary();
    while (true) {
      skip_whitespace();
      char c = peek();
      if (c != '+' && c != ',') return lhs;
      incr();
      auto node = std::make_unique<DependsExpr::Node>();
      node->op = (c == '+' ? DependsExpr::Node::AND : DependsExpr::Node::OR);
      node->lhs = std::move(lhs);
      node->rhs = parse_primary();
      lhs = std::move(node);
    }
  }

  std::unique_ptr<DependsExpr::Node> parse_primary() {
    skip_whitespace();
    if (peek() == '(') {
      incr();
      auto node = parse_sequence();
      skip_whitespace();
      if (peek() != ')') fail("expected )");
      incr();
      return node;
    }
    auto node = std::make_unique<DependsExpr::Node>();
    while (std::isalnum((unsigned char)peek()) || peek() == '_' ||
           peek() == ':')
      node->name += pop();
    if (node->name.empty()) fail("expected a name");
    return node;
  }
};

}  // namespace

DependsExpr::DependsExpr() = default;
DependsExpr::DependsExpr(DependsExpr&&) = default;
DependsExpr& DependsExpr::operator=(DependsExpr&&) = default;
DependsExpr::~DependsExpr() = default;

DependsExpr DependsExpr::parse(const std::string& text,
                               const std::string& location) {
  DependsExpr expr;
  if (vbg::trim(text).empty()) return expr;
  DependsParser parser(location, text);
  expr.root_ = parser.parse_all();
  return expr;
}

bool DependsExpr::evaluate(
    const std::function<bool(const std::string&)>& holds) const {
  if (!root_) return true;
  return root_->evaluate(holds);
}

std::string requires_to_depends(const std::string& requires_list) {
  return vbg::join("+", vbg::split_nonempty(",", requires_list));
}

}  // namespace vkr
