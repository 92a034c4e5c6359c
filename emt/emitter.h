#pragma once

#include <set>
#include <string>

#include "flt/filter.h"
#include "vkr/registry.h"

namespace emt {

struct EmitOptions {
  // Namespace of the generated declarations; may be nested ("a::b").
  std::string ns = "vkb";
  // Named in the banner; defaults to the registry's file name.
  std::string source_name;
};

// Returns the generated header. The text depends only on its inputs.
std::string emit_header(const vkr::Registry& registry,
                        const flt::Selection& selection,
                        const EmitOptions& options);

// "core-1.0" -> "core_1_0"
std::string identifier(const std::string& name);

// The gate to open for `inner` inside a region already gated by `outer`;
// empty when `outer` implies `inner`.
std::set<std::string> nested_gate(const std::set<std::string>& outer,
                                  const std::set<std::string>& inner);

}  // namespace emt
