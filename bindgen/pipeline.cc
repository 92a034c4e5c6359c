#include "bindgen/pipeline.h"

#include <memory>
#include <sstream>

#include "dep/resolver.h"
#include "emt/abi_check_emitter.h"
#include "vbg/file.h"
#include "vbg/json.h"
#include "vbg/log.h"
#include "vkr/json_dump.h"

namespace bindgen {

Output generate(const vkr::Registry& registry, const Options& options) {
  dep::DependencyGraph graph = dep::resolve(registry);
  flt::Selection selection = flt::select(registry, graph, options.filter);

  Output output;
  output.header = emt::emit_header(registry, selection, options.emit);
  if (!options.abi_check_include.empty())
    output.abi_check = emt::emit_abi_check(registry, selection, options.emit,
                                           options.abi_check_include);
  if (options.json) {
    std::ostringstream oss;
    vbg::json_writer w(oss);
    vkr::write_json(w, registry);
    VBG_ASSERT(w.complete());
    output.json = oss.str();
  }
  return output;
}

void write_outputs(const std::vector<OutputFile>& files) {
  std::vector<std::unique_ptr<vbg::atomic_file_writer>> writers;
  for (const OutputFile& file : files) {
    writers.push_back(std::make_unique<vbg::atomic_file_writer>(file.path));
    writers.back()->write(file.text);
  }
  for (size_t i = 0; i < files.size(); i++) {
    writers[i]->commit();
    LOG(INFO) << "wrote " << files[i].path;
  }
}

}  // namespace bindgen
