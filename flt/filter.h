#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "dep/resolver.h"
#include "vkr/registry.h"

namespace flt {

struct Config {
  std::string api = "vulkan";
  // Platform names (xlib, win32, ...) whose extensions may be emitted.
  std::set<std::string> platforms;
  // When non-empty, only extensions by these author tags are emitted.
  std::set<std::string> authors;
  std::set<std::string> excluded_groups;
  // Drop TypeDefs that are required by a group but used by nothing.
  bool prune_unreferenced = false;
};

// What the emitter writes, and under which platform conditions.
class Selection {
 public:
  // Kept groups in registry order.
  std::vector<const vkr::Group*> groups;
  // Kept TypeDefs in resolved order.
  std::vector<const vkr::TypeDef*> types;
  // Kept constants and commands in declaration order.
  std::vector<const vkr::Constant*> constants;
  std::vector<const vkr::Command*> commands;

  bool kept(const vkr::Entity* entity) const;
  bool kept(const vkr::Group* group) const;

  // Kept enumerators of a kept enum, in declaration order.
  std::vector<const vkr::Enumerator*> enumerators(const vkr::Enum* e) const;

  // The kept commands whose effective memberships include `group`.
  std::vector<const vkr::Command*> commands_of(const vkr::Group* group) const;

  // Protect macros an entity is conditional on; empty when some
  // platform-independent path keeps it.
  const std::set<std::string>& platforms(const vkr::Entity* entity) const;

 private:
  friend Selection select(const vkr::Registry& registry,
                          const dep::DependencyGraph& graph,
                          const Config& config);

  std::unordered_set<const vkr::Entity*> kept_entities_;
  std::unordered_set<const vkr::Group*> kept_groups_;
  std::unordered_map<const vkr::Entity*, std::set<std::string>> platforms_;
  std::unordered_map<const vkr::Group*, std::vector<const vkr::Command*>>
      group_commands_;
};

// Throws vbg::dangling_reference when a kept entity needs one that only
// excluded groups provide.
Selection select(const vkr::Registry& registry,
                 const dep::DependencyGraph& graph, const Config& config);

}  // namespace flt
