#include "dep/resolver.h"

#include <algorithm>
#include <functional>
#include <queue>
#include <unordered_set>

#include "vbg/container.h"
#include "vbg/error.h"
#include "vbg/log.h"

namespace dep {
namespace {

const std::vector<const vkr::Entity*> kNoReferences;
const std::vector<const vkr::TypeDef*> kNoDependencies;
const std::vector<const vkr::Group*> kNoGroups;

bool is_aggregate(const vkr::TypeDef* type) {
  vkr::TypeKind kind = type->canonical()->kind();
  return kind == vkr::TypeKind::STRUCT || kind == vkr::TypeKind::UNION;
}

// Follows dependencies among the unsorted TypeDefs from `start` until one
// repeats, and returns the loop.
std::vector<std::string> find_cycle(
    const vkr::TypeDef* start,
    const std::function<const vkr::TypeDef*(const vkr::TypeDef*)>& next) {
  std::vector<const vkr::TypeDef*> path;
  std::unordered_map<const vkr::TypeDef*, size_t> seen;
  const vkr::TypeDef* type = start;
  while (!vbg::contains(seen, type)) {
    seen[type] = path.size();
    path.push_back(type);
    type = next(type);
  }
  std::vector<std::string> cycle;
  for (size_t i = seen[type]; i < path.size(); i++)
    cycle.push_back(path[i]->name);
  cycle.push_back(type->name);
  return cycle;
}

}  // namespace

const std::vector<const vkr::Entity*>& DependencyGraph::references(
    const vkr::Entity* entity) const {
  auto it = references_.find(entity);
  return it == references_.end() ? kNoReferences : it->second;
}

const std::vector<const vkr::TypeDef*>& DependencyGraph::dependencies(
    const vkr::TypeDef* type) const {
  auto it = dependencies_.find(type);
  return it == dependencies_.end() ? kNoDependencies : it->second;
}

size_t DependencyGraph::position(const vkr::TypeDef* type) const {
  auto it = position_.find(type);
  VBG_ASSERT(it != position_.end(), type->name, " is not ordered");
  return it->second;
}

const std::vector<const vkr::Group*>& DependencyGraph::groups(
    const vkr::Command* command) const {
  auto it = groups_.find(command);
  return it == groups_.end() ? kNoGroups : it->second;
}

void DependencyGraph::add_edge(const vkr::TypeDef* from,
                               const vkr::TypeDef* to) {
  if (from == to) return;
  std::vector<const vkr::TypeDef*>& deps = dependencies_[from];
  if (std::find(deps.begin(), deps.end(), to) == deps.end())
    deps.push_back(to);
}

void DependencyGraph::add_reference(const vkr::Entity* from,
                                    const vkr::TypeRef& ref) {
  std::vector<const vkr::Entity*>& refs = references_[from];
  if (std::find(refs.begin(), refs.end(), ref.entity) == refs.end())
    refs.push_back(ref.entity);

  auto from_type = dynamic_cast<const vkr::TypeDef*>(from);
  auto to_type = dynamic_cast<const vkr::TypeDef*>(ref.entity);
  if (!from_type || !to_type) return;

  vkr::RefMode mode = ref.mode;
  // An alias of a struct or union only needs the forward declaration.
  if (from_type->kind() == vkr::TypeKind::ALIAS && is_aggregate(to_type))
    mode = vkr::RefMode::POINTER;

  switch (mode) {
    case vkr::RefMode::VALUE:
      add_edge(from_type, to_type);
      add_edge(from_type, to_type->canonical());
      break;
    case vkr::RefMode::POINTER:
    case vkr::RefMode::SIGNATURE:
      if (!is_aggregate(to_type) ||
          to_type->kind() == vkr::TypeKind::ALIAS)
        add_edge(from_type, to_type);
      break;
  }
}

// Kahn's algorithm; among ready TypeDefs the lowest declaration index wins.
void DependencyGraph::sort(const vkr::Registry& registry) {
  std::unordered_map<const vkr::TypeDef*, size_t> pending;
  std::unordered_map<const vkr::TypeDef*, std::vector<const vkr::TypeDef*>>
      dependents;
  for (const auto& type : registry.types) {
    const std::vector<const vkr::TypeDef*>& deps = dependencies(type.get());
    pending[type.get()] = deps.size();
    for (const vkr::TypeDef* dep : deps) dependents[dep].push_back(type.get());
  }

  auto later = [](const vkr::TypeDef* a, const vkr::TypeDef* b) {
    return a->index > b->index;
  };
  std::priority_queue<const vkr::TypeDef*, std::vector<const vkr::TypeDef*>,
                      decltype(later)>
      ready(later);
  for (const auto& type : registry.types)
    if (pending[type.get()] == 0) ready.push(type.get());

  while (!ready.empty()) {
    const vkr::TypeDef* type = ready.top();
    ready.pop();
    position_[type] = order_.size();
    order_.push_back(type);
    for (const vkr::TypeDef* dependent : dependents[type])
      if (--pending[dependent] == 0) ready.push(dependent);
  }

  if (order_.size() == registry.types.size()) return;

  const vkr::TypeDef* start = nullptr;
  for (const auto& type : registry.types)
    if (pending[type.get()] != 0) {
      start = type.get();
      break;
    }
  VBG_ASSERT(start);
  throw vbg::cyclic_type_dependency(
      find_cycle(start, [&](const vkr::TypeDef* type) {
        for (const vkr::TypeDef* dep : dependencies(type))
          if (pending[dep] != 0) return dep;
        VBG_FATAL("unsorted ", type->name, " has no unsorted dependency");
        return type;
      }));
}

DependencyGraph resolve(const vkr::Registry& registry) {
  DependencyGraph graph;
  std::vector<vkr::TypeRef> refs;

  for (const auto& type : registry.types) {
    refs.clear();
    type->collect_refs(refs);
    for (const vkr::TypeRef& ref : refs) graph.add_reference(type.get(), ref);
  }

  for (const auto& command : registry.commands) {
    refs.clear();
    command->collect_refs(refs);
    for (const vkr::TypeRef& ref : refs)
      graph.add_reference(command.get(), ref);
    std::vector<const vkr::Group*>& groups = graph.groups_[command.get()];
    for (const vkr::Membership& membership : command->memberships)
      if (std::find(groups.begin(), groups.end(), membership.group) ==
          groups.end())
        groups.push_back(membership.group);
  }

  graph.sort(registry);

  size_t edges = 0;
  for (const auto& [type, deps] : graph.dependencies_) edges += deps.size();
  LOG(INFO) << "resolved " << graph.order_.size() << " types with " << edges
            << " ordering edges";
  return graph;
}

}  // namespace dep
