#pragma once

#include <string>

#include "vbg/error.h"
#include "vbg/log.h"

namespace vbg {

// Character cursor over a snippet of registry text. Errors are reported as
// malformed_registry at the snippet's location.
class scanner {
 public:
  scanner(const std::string& location, std::string data)
      : location_(location), data(std::move(data)) {}

  static constexpr char eof = 0;

  char peek(size_t offset = 0) const {
    if (pos() + offset >= data.size())
      return eof;
    else
      return data[pos() + offset];
  }

  char pop() {
    char c = peek();
    incr();
    return c;
  }

  size_t pos() const { return pos_; }
  void pos(size_t pos) { this->pos_ = pos; }

  void incr(size_t offset = 1) {
    pos_ += offset;
    if (pos() > data.size()) fail("unexpected end of text");
  }

  const std::string& get_data() const { return data; }
  const std::string& location() const { return location_; }

  template <typename... Args>
  [[noreturn]] void fail(Args&&... args) const {
    throw malformed_registry(
        concat(std::forward<Args>(args)..., " in '", data, "'"), location_);
  }

 private:
  std::string location_;
  const std::string data;
  size_t pos_ = 0;
};

}  // namespace vbg
