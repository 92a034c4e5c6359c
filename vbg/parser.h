#pragma once

#include <string>
#include <vector>

#include "vbg/error.h"
#include "vbg/log.h"

namespace vbg {

template <class Token>
class parser {
 public:
  parser(const std::string& location, std::string text,
         std::vector<Token> data)
      : location_(location), text_(std::move(text)), data(std::move(data)) {}

  const Token& peek(size_t offset = 0) const {
    if (pos() + offset >= data.size()) return data.back();
    return data[pos() + offset];
  }

  const Token& pop() {
    const Token& token = peek();
    incr();
    return token;
  }

  size_t pos() const { return pos_; }
  void pos(size_t pos) { this->pos_ = pos; }

  void incr(size_t offset = 1) {
    pos_ += offset;
    if (pos() >= data.size()) fail("unexpected end of declaration");
  }

  template <typename... Args>
  [[noreturn]] void fail(Args&&... args) const {
    throw malformed_registry(
        concat(std::forward<Args>(args)..., " in '", text_, "'"), location_);
  }

  template <typename... Args>
  void expect(bool cond, Args&&... args) const {
    if (!cond) fail(std::forward<Args>(args)...);
  }

 private:
  std::string location_;
  std::string text_;
  const std::vector<Token> data;
  size_t pos_ = 0;
};

}  // namespace vbg
