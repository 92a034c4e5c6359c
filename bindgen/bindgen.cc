#include <gflags/gflags.h>

#include <filesystem>
#include <set>
#include <vector>

#include "bindgen/pipeline.h"
#include "vbg/error.h"
#include "vbg/log.h"
#include "vbg/program.h"
#include "vbg/string.h"
#include "vkr/registry_parser.h"

DEFINE_string(registry, "", "Input vk.xml");
DEFINE_string(api, "vulkan", "API to generate for (vulkan, vulkansc)");
DEFINE_string(platforms, "", "Comma-separated platforms to include, e.g. xlib,wayland");
DEFINE_string(authors, "", "Comma-separated extension author tags; all when empty");
DEFINE_string(exclude_groups, "", "Comma-separated features or extensions to drop");
DEFINE_bool(prune, false, "Drop required types that nothing references");
DEFINE_uint64(header_version, 0, "Expected VK_HEADER_VERSION; 0 accepts any");
DEFINE_string(out, "", "Output C++ header");
DEFINE_string(out_abi_check, "", "Output ABI check translation unit");
DEFINE_string(abi_check_include, "", "How the ABI check includes --out; defaults to its file name");
DEFINE_string(out_json, "", "Output parsed registry as json");
DEFINE_string(namespace, "vkb", "Namespace of the generated declarations");

namespace {

std::set<std::string> flag_set(const std::string& flag) {
  std::set<std::string> result;
  for (const std::string& item : vbg::split_nonempty(",", flag))
    result.insert(vbg::trim(item));
  return result;
}

int run() {
  if (FLAGS_registry.empty()) {
    LOG(ERROR) << "--registry required";
    return 2;
  }
  if (FLAGS_out.empty()) {
    LOG(ERROR) << "--out required";
    return 2;
  }

  vkr::ParseOptions parse_options;
  parse_options.api = FLAGS_api;
  if (FLAGS_header_version != 0)
    parse_options.expected_header_version =
        static_cast<uint32_t>(FLAGS_header_version);
  vkr::Registry registry =
      vkr::parse_registry_file(FLAGS_registry, parse_options);

  bindgen::Options options;
  options.filter.api = FLAGS_api;
  options.filter.platforms = flag_set(FLAGS_platforms);
  options.filter.authors = flag_set(FLAGS_authors);
  options.filter.excluded_groups = flag_set(FLAGS_exclude_groups);
  options.filter.prune_unreferenced = FLAGS_prune;
  options.emit.ns = FLAGS_namespace;
  if (!FLAGS_out_abi_check.empty()) {
    options.abi_check_include = FLAGS_abi_check_include;
    if (options.abi_check_include.empty())
      options.abi_check_include =
          std::filesystem::path(FLAGS_out).filename().string();
  }
  options.json = !FLAGS_out_json.empty();

  bindgen::Output output = bindgen::generate(registry, options);

  std::vector<bindgen::OutputFile> files = {{FLAGS_out, output.header}};
  if (!FLAGS_out_abi_check.empty())
    files.push_back({FLAGS_out_abi_check, output.abi_check});
  if (!FLAGS_out_json.empty()) files.push_back({FLAGS_out_json, output.json});
  bindgen::write_outputs(files);
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  vbg::program program(argc, argv,
                       "vkbindgen --registry vk.xml --out vkb.h [options]");
  try {
    return run();
  } catch (const vbg::error& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
