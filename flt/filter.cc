#include "flt/filter.h"

#include <algorithm>

#include "vbg/container.h"
#include "vbg/error.h"
#include "vbg/log.h"
#include "vkr/depends.h"

namespace flt {
namespace {

const std::set<std::string> kPortable;

// Platform condition under which a kept entity is needed.
struct Gate {
  bool portable = false;
  std::set<std::string> protects;

  // Returns true if this gate widened.
  bool merge(const Gate& other) {
    if (portable) return false;
    if (other.portable) {
      portable = true;
      protects.clear();
      return true;
    }
    size_t before = protects.size();
    protects.insert(other.protects.begin(), other.protects.end());
    return protects.size() != before;
  }
};

class Filter {
 public:
  Filter(const vkr::Registry& registry, const dep::DependencyGraph& graph,
         const Config& config)
      : registry_(registry), graph_(graph), config_(config) {}

  void run(Selection& selection,
           std::unordered_set<const vkr::Entity*>& kept_entities,
           std::unordered_set<const vkr::Group*>& kept_groups,
           std::unordered_map<const vkr::Entity*, std::set<std::string>>&
               platforms) {
    select_groups();
    kept_groups = kept_groups_;

    std::vector<const vkr::Entity*> roots;
    for (const auto& type : registry_.types)
      if (membership_kept(type.get())) roots.push_back(type.get());
    for (const auto& constant : registry_.constants)
      if (membership_kept(constant.get())) roots.push_back(constant.get());
    for (const auto& command : registry_.commands)
      if (membership_kept(command.get())) roots.push_back(command.get());

    std::unordered_set<const vkr::Entity*> kept = closure(roots);
    if (config_.prune_unreferenced) prune(roots, kept);

    for (const auto& enumerator : registry_.enumerators)
      if (vbg::contains(kept, enumerator->parent) &&
          (enumerator->unconditional() || membership_kept(enumerator.get())))
        kept.insert(enumerator.get());

    compute_platforms(kept, platforms);

    for (const auto& group : registry_.groups)
      if (vbg::contains(kept_groups_, group.get()))
        selection.groups.push_back(group.get());
    for (const vkr::TypeDef* type : graph_.order())
      if (vbg::contains(kept, type)) selection.types.push_back(type);
    for (const auto& constant : registry_.constants)
      if (vbg::contains(kept, constant.get()))
        selection.constants.push_back(constant.get());
    for (const auto& command : registry_.commands)
      if (vbg::contains(kept, command.get()))
        selection.commands.push_back(command.get());

    LOG(INFO) << "selected " << selection.groups.size() << " groups, "
              << selection.types.size() << " types, "
              << selection.constants.size() << " constants, "
              << selection.commands.size() << " commands";
    kept_entities = std::move(kept);
  }

  // A command's membership in `group` whose block condition holds.
  bool effective_member(const vkr::Entity* entity, const vkr::Group* group) {
    for (const vkr::Membership& membership : entity->memberships)
      if (membership.group == group && effective(membership)) return true;
    return false;
  }

 private:
  std::string exclusion_reason(const vkr::Group& group) const {
    if (!group.supports(config_.api))
      return "does not support " + config_.api;
    if (group.platform && !vbg::contains(config_.platforms, group.platform->name))
      return "platform " + group.platform->name + " not selected";
    if (group.kind == vkr::GroupKind::EXTENSION && !config_.authors.empty() &&
        !vbg::contains(config_.authors, group.author))
      return "author " + group.author + " not selected";
    if (vbg::contains(config_.excluded_groups, group.name))
      return "excluded by configuration";
    return "";
  }

  bool group_kept(const std::string& name) const {
    const vkr::Group* group = registry_.find_group(name);
    return group && vbg::contains(kept_groups_, group);
  }

  void select_groups() {
    for (const auto& group : registry_.groups) {
      std::string reason = exclusion_reason(*group);
      if (reason.empty())
        kept_groups_.insert(group.get());
      else
        VLOG(1) << "excluding " << group->name << ": " << reason;
    }

    // Exclusion cascades through depends until nothing changes.
    bool changed = true;
    while (changed) {
      changed = false;
      for (const auto& group : registry_.groups) {
        if (!vbg::contains(kept_groups_, group.get())) continue;
        vkr::DependsExpr depends =
            vkr::DependsExpr::parse(group->depends, group->name);
        if (depends.evaluate(
                [this](const std::string& name) { return group_kept(name); }))
          continue;
        VLOG(1) << "excluding " << group->name << ": depends on "
                << group->depends;
        kept_groups_.erase(group.get());
        changed = true;
      }
    }
  }

  bool holds(const std::string& depends) {
    auto it = conditions_.find(depends);
    if (it != conditions_.end()) return it->second;
    bool result = vkr::DependsExpr::parse(depends, "require depends")
                      .evaluate([this](const std::string& name) {
                        return group_kept(name);
                      });
    conditions_.emplace(depends, result);
    return result;
  }

  bool effective(const vkr::Membership& membership) {
    return vbg::contains(kept_groups_, membership.group) &&
           holds(membership.depends);
  }

  bool membership_kept(const vkr::Entity* entity) {
    return std::any_of(
        entity->memberships.begin(), entity->memberships.end(),
        [this](const vkr::Membership& m) { return effective(m); });
  }

  std::unordered_set<const vkr::Entity*> closure(
      const std::vector<const vkr::Entity*>& roots) {
    std::unordered_set<const vkr::Entity*> kept(roots.begin(), roots.end());
    std::vector<const vkr::Entity*> work(roots.rbegin(), roots.rend());
    while (!work.empty()) {
      const vkr::Entity* entity = work.back();
      work.pop_back();
      for (const vkr::Entity* ref : graph_.references(entity)) {
        if (vbg::contains(kept, ref)) continue;
        if (!ref->unconditional() && !membership_kept(ref))
          throw vbg::dangling_reference(ref->name, entity->name);
        VLOG(1) << entity->name << " pulls in " << ref->name;
        kept.insert(ref);
        work.push_back(ref);
      }
    }
    return kept;
  }

  void prune(std::vector<const vkr::Entity*>& roots,
             std::unordered_set<const vkr::Entity*>& kept) {
    while (true) {
      std::unordered_set<const vkr::Entity*> referenced;
      for (const vkr::Entity* entity : kept) {
        for (const vkr::Entity* ref : graph_.references(entity))
          if (ref != entity) referenced.insert(ref);
        // A flags type keeps its bit values.
        if (auto bitmask = dynamic_cast<const vkr::Bitmask*>(entity))
          if (const vkr::Entity* bits = registry_.find(bitmask->bitvalues))
            referenced.insert(bits);
      }
      std::vector<const vkr::Entity*> remaining;
      for (const vkr::Entity* root : roots) {
        if (dynamic_cast<const vkr::TypeDef*>(root) &&
            !vbg::contains(referenced, root)) {
          VLOG(1) << "pruning unreferenced " << root->name;
          continue;
        }
        remaining.push_back(root);
      }
      if (remaining.size() == roots.size()) return;
      roots = std::move(remaining);
      kept = closure(roots);
    }
  }

  Gate membership_gate(const vkr::Entity* entity) {
    Gate gate;
    if (entity->memberships.empty()) return gate;
    for (const vkr::Membership& membership : entity->memberships) {
      if (!effective(membership)) continue;
      Gate one;
      if (membership.group->platform)
        one.protects.insert(membership.group->platform->protect);
      else
        one.portable = true;
      gate.merge(one);
    }
    return gate;
  }

  // Starts from each entity's own memberships and widens referenced
  // entities by the conditions of everything that references them.
  void compute_platforms(
      const std::unordered_set<const vkr::Entity*>& kept,
      std::unordered_map<const vkr::Entity*, std::set<std::string>>&
          platforms) {
    std::unordered_map<const vkr::Entity*, Gate> gates;
    std::vector<const vkr::Entity*> work;
    auto seed = [&](const vkr::Entity* entity) {
      if (!vbg::contains(kept, entity)) return;
      Gate gate = membership_gate(entity);
      if (entity->unconditional() &&
          dynamic_cast<const vkr::Enumerator*>(entity))
        gate.portable = true;
      gates[entity] = gate;
      work.push_back(entity);
    };
    for (const auto& type : registry_.types) seed(type.get());
    for (const auto& constant : registry_.constants) seed(constant.get());
    for (const auto& command : registry_.commands) seed(command.get());
    for (const auto& enumerator : registry_.enumerators)
      seed(enumerator.get());

    while (!work.empty()) {
      const vkr::Entity* entity = work.back();
      work.pop_back();
      Gate gate = gates[entity];
      if (!gate.portable && gate.protects.empty()) continue;
      for (const vkr::Entity* ref : graph_.references(entity)) {
        if (!vbg::contains(kept, ref)) continue;
        if (gates[ref].merge(gate)) work.push_back(ref);
      }
    }

    for (const auto& [entity, gate] : gates)
      if (!gate.portable && !gate.protects.empty())
        platforms[entity] = gate.protects;
  }

  const vkr::Registry& registry_;
  const dep::DependencyGraph& graph_;
  const Config& config_;
  std::unordered_set<const vkr::Group*> kept_groups_;
  std::unordered_map<std::string, bool> conditions_;
};

}  // namespace

bool Selection::kept(const vkr::Entity* entity) const {
  return vbg::contains(kept_entities_, entity);
}

bool Selection::kept(const vkr::Group* group) const {
  return vbg::contains(kept_groups_, group);
}

std::vector<const vkr::Enumerator*> Selection::enumerators(
    const vkr::Enum* e) const {
  std::vector<const vkr::Enumerator*> result;
  for (const vkr::Enumerator* enumerator : e->enumerators)
    if (kept(enumerator)) result.push_back(enumerator);
  return result;
}

std::vector<const vkr::Command*> Selection::commands_of(
    const vkr::Group* group) const {
  auto it = group_commands_.find(group);
  if (it == group_commands_.end()) return {};
  return it->second;
}

const std::set<std::string>& Selection::platforms(
    const vkr::Entity* entity) const {
  auto it = platforms_.find(entity);
  return it == platforms_.end() ? kPortable : it->second;
}

Selection select(const vkr::Registry& registry,
                 const dep::DependencyGraph& graph, const Config& config) {
  VBG_ASSERT_EQ(config.api, registry.api, "registry parsed for another API");
  for (const std::string& platform : config.platforms)
    if (!vbg::contains(registry.platform_map, platform))
      LOG(WARNING) << "unknown platform " << platform;

  Selection selection;
  Filter filter(registry, graph, config);
  filter.run(selection, selection.kept_entities_, selection.kept_groups_,
             selection.platforms_);

  for (const vkr::Group* group : selection.groups) {
    std::vector<const vkr::Command*>& commands =
        selection.group_commands_[group];
    for (const vkr::Command* command : group->commands)
      if (selection.kept(command) && filter.effective_member(command, group))
        commands.push_back(command);
  }
  return selection;
}

}  // namespace flt
