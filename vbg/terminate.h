#pragma once

namespace vbg {

void terminate_handler();

void log_stacktrace();

// glog failure function: logs the stack of a failed CHECK, then aborts.
void log_stacktrace_and_abort();

void log_current_exception();

void install_terminate_handler();

void install_segfault_handler();

}  // namespace vbg
