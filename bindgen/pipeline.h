#pragma once

#include <string>
#include <vector>

#include "emt/emitter.h"
#include "flt/filter.h"
#include "vkr/registry.h"

namespace bindgen {

struct Options {
  flt::Config filter;
  emt::EmitOptions emit;
  // How the ABI check includes the header; no check is made when empty.
  std::string abi_check_include;
  bool json = false;
};

struct Output {
  std::string header;
  std::string abi_check;
  std::string json;
};

struct OutputFile {
  std::string path;
  std::string text;
};

// Resolve, filter and emit. Throws vbg::cyclic_type_dependency and
// vbg::dangling_reference.
Output generate(const vkr::Registry& registry, const Options& options);

// Writes every file before committing any, so a failed open or write leaves
// no output in place. Throws vbg::emission_failure.
void write_outputs(const std::vector<OutputFile>& files);

}  // namespace bindgen
