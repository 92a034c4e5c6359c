#pragma once

#include <string>

#include "emt/emitter.h"
#include "flt/filter.h"
#include "vkr/registry.h"

namespace emt {

// Returns a translation unit that compiles only if the header emitted with
// the same inputs, included as `header_include`, is layout compatible with
// the system <vulkan/vulkan.h>: struct size, alignment and member offsets,
// enum sizes and enumerator values, constants, and function pointer shapes.
std::string emit_abi_check(const vkr::Registry& registry,
                           const flt::Selection& selection,
                           const EmitOptions& options,
                           const std::string& header_include);

}  // namespace emt
