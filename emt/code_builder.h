#pragma once

#include <set>
#include <sstream>
#include <string>
#include <utility>

#include "vbg/string.h"

namespace emt {

// Line-oriented text sink for generated C++. Lines printed with println are
// indented to the current depth; preprocessor lines never are.
class code_builder {
 public:
  template <typename... Args>
  void print(Args&&... args) {
    if (at_line_start_) oss_ << std::string(2 * depth_, ' ');
    at_line_start_ = false;
    (oss_ << ... << std::forward<Args>(args));
  }

  void println() {
    oss_ << "\n";
    at_line_start_ = true;
  }

  template <typename... Args>
  void println(Args&&... args) {
    print(std::forward<Args>(args)...);
    println();
  }

  void indent() { depth_++; }
  void dedent() { depth_--; }

  // Opens "#if defined(A) || defined(B)" for a non-empty platform set.
  void open_gate(const std::set<std::string>& protects) {
    if (protects.empty()) return;
    std::set<std::string> terms;
    for (const std::string& protect : protects)
      terms.insert("defined(" + protect + ")");
    oss_ << "#if " << vbg::join(" || ", terms) << "\n";
  }

  void close_gate(const std::set<std::string>& protects) {
    if (protects.empty()) return;
    oss_ << "#endif\n";
  }

  std::string str() const { return oss_.str(); }

 private:
  std::ostringstream oss_;
  int depth_ = 0;
  bool at_line_start_ = true;
};

}  // namespace emt
