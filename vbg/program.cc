#include "vbg/program.h"

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "vbg/terminate.h"

namespace vbg {

program::program(int& argc, char**& argv, const char* usage) {
  google::InitGoogleLogging(argv[0]);
  gflags::SetUsageMessage(usage);
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  vbg::install_terminate_handler();
  vbg::install_segfault_handler();
  google::InstallFailureFunction(vbg::log_stacktrace_and_abort);
  args = std::vector<std::string>(argv + 1, argv + argc);
}

program::~program() {
  gflags::ShutDownCommandLineFlags();
  google::ShutdownGoogleLogging();
}

}  // namespace vbg
