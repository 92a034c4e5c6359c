#include "vkr/registry.h"

#include <algorithm>
#include <limits>
#include <sstream>

#include "vbg/container.h"

namespace vkr {

bool Entity::member_of(const Group* group) const {
  return std::any_of(memberships.begin(), memberships.end(),
                     [group](const Membership& m) { return m.group == group; });
}

std::string Const::to_string() const {
  if (dynamic_cast<const Name*>(T.get()) ||
      dynamic_cast<const Elaborated*>(T.get()))
    return "const " + T->to_string();
  return T->to_string() + " const";
}

std::string_view to_string(TypeKind kind) {
  switch (kind) {
    case TypeKind::PRIMITIVE:
      return "primitive";
    case TypeKind::EXTERNAL:
      return "external";
    case TypeKind::BASETYPE:
      return "basetype";
    case TypeKind::BITMASK:
      return "bitmask";
    case TypeKind::ENUM:
      return "enum";
    case TypeKind::HANDLE:
      return "handle";
    case TypeKind::STRUCT:
      return "struct";
    case TypeKind::UNION:
      return "union";
    case TypeKind::FUNCPOINTER:
      return "funcpointer";
    case TypeKind::ALIAS:
      return "alias";
  }
  return "UNKNOWN";
}

std::string_view to_string(DispatchLevel level) {
  switch (level) {
    case DispatchLevel::GLOBAL:
      return "global";
    case DispatchLevel::INSTANCE:
      return "instance";
    case DispatchLevel::DEVICE:
      return "device";
  }
  return "UNKNOWN";
}

const TypeDef* TypeDef::canonical() const {
  const TypeDef* type = this;
  while (auto alias = dynamic_cast<const Alias*>(type)) type = alias->target;
  return type;
}

void BaseType::collect_refs(std::vector<TypeRef>& refs) const {
  if (underlying) underlying->collect_refs(refs, RefMode::VALUE);
}

std::string Enum::underlying_type() const {
  bool negative = false;
  bool wide = false;
  for (const Enumerator* enumerator : enumerators) {
    if (enumerator->value < 0) negative = true;
    if (enumerator->value > std::numeric_limits<int32_t>::max()) wide = true;
  }
  if (wide && !negative) return "uint32_t";
  return "int32_t";
}

bool Handle::descends_from(const std::string& ancestor) const {
  if (name == ancestor) return true;
  for (const Handle* parent : parents)
    if (parent->descends_from(ancestor)) return true;
  return false;
}

void Struct::collect_refs(std::vector<TypeRef>& refs) const {
  for (const Member& member : members)
    member.type->collect_refs(refs, RefMode::VALUE);
}

std::string signature_string(const Type& return_type,
                             const std::vector<Param>& params,
                             const std::string& calling_convention) {
  std::ostringstream oss;
  oss << return_type.to_string() << " (";
  if (!calling_convention.empty()) oss << calling_convention << " ";
  oss << "*)(";
  for (size_t i = 0; i < params.size(); i++) {
    if (i != 0) oss << ", ";
    oss << params[i].type->to_string();
  }
  oss << ")";
  return oss.str();
}

void FuncPointer::collect_refs(std::vector<TypeRef>& refs) const {
  return_type->collect_refs(refs, RefMode::SIGNATURE);
  for (const Param& param : params)
    param.type->collect_refs(refs, RefMode::SIGNATURE);
}

void Command::collect_refs(std::vector<TypeRef>& refs) const {
  if (alias) {
    refs.push_back({alias, RefMode::VALUE});
    return;
  }
  return_type->collect_refs(refs, RefMode::SIGNATURE);
  for (const Param& param : params)
    param.type->collect_refs(refs, RefMode::SIGNATURE);
}

bool Group::supports(const std::string& api) const {
  return std::find(supported.begin(), supported.end(), api) != supported.end();
}

const Entity* Registry::find(const std::string& name) const {
  return vbg::find_or_null(entities, name);
}

const Group* Registry::find_group(const std::string& name) const {
  return vbg::find_or_null(group_map, name);
}

}  // namespace vkr
