#pragma once

#include "vbg/json.h"
#include "vkr/registry.h"

namespace vkr {

// Writes the parsed model as one JSON object, for inspecting what the
// parser made of a registry.
void write_json(vbg::json_writer& w, const Registry& registry);

}  // namespace vkr
