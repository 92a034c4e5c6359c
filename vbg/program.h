#pragma once

#include <string>
#include <vector>

namespace vbg {

// Process bootstrap for command-line tools: glog, gflags and the crash
// handlers. Keep one on the stack of main().
struct program {
  std::vector<std::string> args;
  program(int& argc, char**& argv, const char* usage);
  ~program();
};

}  // namespace vbg
