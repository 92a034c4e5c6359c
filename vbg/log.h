#pragma once

#include <glog/logging.h>

#include <sstream>
#include <string>
#include <utility>

namespace vbg {

template <typename... Args>
std::string concat(Args&&... args) {
  std::ostringstream oss;
  (oss << ... << std::forward<Args>(args));
  return oss.str();
}

}  // namespace vbg

#define VBG_ASSERT_IMPL(cond, ...) \
  CHECK(cond) << ::vbg::concat(__VA_ARGS__)
#define VBG_ASSERT(...) VBG_ASSERT_IMPL(__VA_ARGS__, "")

#define VBG_ASSERT_EQ_IMPL(a, b, ...) \
  CHECK_EQ(a, b) << ::vbg::concat(__VA_ARGS__)
#define VBG_ASSERT_EQ(...) VBG_ASSERT_EQ_IMPL(__VA_ARGS__, "")

#define VBG_FATAL(...) LOG(FATAL) << ::vbg::concat(__VA_ARGS__)
