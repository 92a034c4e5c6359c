#pragma once

#include <unordered_map>
#include <vector>

#include "vkr/registry.h"

namespace dep {

// Directed graph over the registry's TypeDefs and Commands. An ordering
// edge runs from a TypeDef to each TypeDef that must be declared before it;
// a reference is anything an entity's declaration names, ordering or not.
class DependencyGraph {
 public:
  // Every entity named by `entity`'s declaration, in first-mention order.
  const std::vector<const vkr::Entity*>& references(
      const vkr::Entity* entity) const;

  // The TypeDefs `type` must follow.
  const std::vector<const vkr::TypeDef*>& dependencies(
      const vkr::TypeDef* type) const;

  // All TypeDefs, each after its dependencies. Unrelated TypeDefs keep
  // registry declaration order.
  const std::vector<const vkr::TypeDef*>& order() const { return order_; }

  size_t position(const vkr::TypeDef* type) const;

  // The groups whose <require> blocks name `command`.
  const std::vector<const vkr::Group*>& groups(
      const vkr::Command* command) const;

 private:
  friend DependencyGraph resolve(const vkr::Registry& registry);

  void add_reference(const vkr::Entity* from, const vkr::TypeRef& ref);
  void add_edge(const vkr::TypeDef* from, const vkr::TypeDef* to);
  void sort(const vkr::Registry& registry);

  std::unordered_map<const vkr::Entity*, std::vector<const vkr::Entity*>>
      references_;
  std::unordered_map<const vkr::TypeDef*, std::vector<const vkr::TypeDef*>>
      dependencies_;
  std::unordered_map<const vkr::Command*, std::vector<const vkr::Group*>>
      groups_;
  std::vector<const vkr::TypeDef*> order_;
  std::unordered_map<const vkr::TypeDef*, size_t> position_;
};

// Builds the graph and orders it. Throws vbg::cyclic_type_dependency.
DependencyGraph resolve(const vkr::Registry& registry);

}  // namespace dep
