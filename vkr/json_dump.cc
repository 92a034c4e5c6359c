#include "vkr/json_dump.h"

namespace vkr {
namespace {

void write_memberships(vbg::json_writer& w, const Entity& entity) {
  w.write_key("memberships");
  w.start_array();
  for (const Membership& membership : entity.memberships) {
    w.start_object();
    w.write_key("group");
    w.write_string(membership.group->name);
    if (!membership.depends.empty()) {
      w.write_key("depends");
      w.write_string(membership.depends);
    }
    w.end_object();
  }
  w.end_array();
  if (entity.removed) {
    w.write_key("removed");
    w.write_bool(true);
  }
}

void write_strings(vbg::json_writer& w, std::string_view key,
                   const std::vector<std::string>& strings) {
  if (strings.empty()) return;
  w.write_key(key);
  w.start_array();
  for (const std::string& s : strings) w.write_string(s);
  w.end_array();
}

void write_params(vbg::json_writer& w, const std::vector<Param>& params) {
  w.write_key("params");
  w.start_array();
  for (const Param& param : params) {
    w.start_object();
    w.write_key("name");
    w.write_string(param.name);
    w.write_key("type");
    w.write_string(param.type->to_string());
    if (!param.len.empty()) {
      w.write_key("len");
      w.write_string(param.len);
    }
    if (param.optional) {
      w.write_key("optional");
      w.write_bool(true);
    }
    w.end_object();
  }
  w.end_array();
}

void write_type(vbg::json_writer& w, const TypeDef& type) {
  w.start_object();
  w.write_key("name");
  w.write_string(type.name);
  w.write_key("kind");
  w.write_string(to_string(type.kind()));
  w.write_key("line");
  w.write_int(type.line);

  switch (type.kind()) {
    case TypeKind::PRIMITIVE:
      break;
    case TypeKind::EXTERNAL:
      w.write_key("header");
      w.write_string(static_cast<const External&>(type).header);
      break;
    case TypeKind::BASETYPE: {
      auto& basetype = static_cast<const BaseType&>(type);
      if (basetype.underlying) {
        w.write_key("underlying");
        w.write_string(basetype.underlying->to_string());
      } else if (basetype.opaque) {
        w.write_key("opaque");
        w.write_bool(true);
      } else {
        w.write_key("verbatim");
        w.write_string(basetype.verbatim);
      }
      break;
    }
    case TypeKind::BITMASK: {
      auto& bitmask = static_cast<const Bitmask&>(type);
      w.write_key("flags");
      w.write_string(bitmask.flags->name);
      if (!bitmask.bitvalues.empty()) {
        w.write_key("bitvalues");
        w.write_string(bitmask.bitvalues);
      }
      break;
    }
    case TypeKind::ENUM: {
      auto& enum_ = static_cast<const Enum&>(type);
      w.write_key("bitmask");
      w.write_bool(enum_.is_bitmask);
      w.write_key("bitwidth");
      w.write_int(enum_.bitwidth);
      w.write_key("enumerators");
      w.start_array();
      for (const Enumerator* enumerator : enum_.enumerators) {
        w.start_object();
        w.write_key("name");
        w.write_string(enumerator->name);
        w.write_key("value");
        w.write_int(enumerator->value);
        if (enumerator->alias) {
          w.write_key("alias");
          w.write_string(enumerator->alias->name);
        }
        write_memberships(w, *enumerator);
        w.end_object();
      }
      w.end_array();
      break;
    }
    case TypeKind::HANDLE: {
      auto& handle = static_cast<const Handle&>(type);
      w.write_key("dispatchable");
      w.write_bool(handle.dispatchable);
      w.write_key("parents");
      w.start_array();
      for (const Handle* parent : handle.parents) w.write_string(parent->name);
      w.end_array();
      break;
    }
    case TypeKind::STRUCT:
    case TypeKind::UNION: {
      auto& s = static_cast<const Struct&>(type);
      if (s.returnedonly) {
        w.write_key("returnedonly");
        w.write_bool(true);
      }
      write_strings(w, "structextends", s.structextends);
      w.write_key("members");
      w.start_array();
      for (const Member& member : s.members) {
        w.start_object();
        w.write_key("name");
        w.write_string(member.name);
        w.write_key("type");
        w.write_string(member.type->to_string());
        if (member.bitfield_width) {
          w.write_key("bitfield_width");
          w.write_int(*member.bitfield_width);
        }
        if (!member.values.empty()) {
          w.write_key("values");
          w.write_string(member.values);
        }
        if (!member.len.empty()) {
          w.write_key("len");
          w.write_string(member.len);
        }
        w.end_object();
      }
      w.end_array();
      break;
    }
    case TypeKind::FUNCPOINTER: {
      auto& funcpointer = static_cast<const FuncPointer&>(type);
      w.write_key("return_type");
      w.write_string(funcpointer.return_type->to_string());
      write_params(w, funcpointer.params);
      break;
    }
    case TypeKind::ALIAS: {
      auto& alias = static_cast<const Alias&>(type);
      w.write_key("target");
      w.write_string(alias.target->name);
      break;
    }
  }
  write_memberships(w, type);
  w.end_object();
}

void write_command(vbg::json_writer& w, const Command& command) {
  w.start_object();
  w.write_key("name");
  w.write_string(command.name);
  w.write_key("level");
  w.write_string(to_string(command.level));
  if (command.alias) {
    w.write_key("alias");
    w.write_string(command.alias->name);
  } else {
    w.write_key("return_type");
    w.write_string(command.return_type->to_string());
    write_params(w, command.params);
    write_strings(w, "successcodes", command.successcodes);
    write_strings(w, "errorcodes", command.errorcodes);
  }
  write_memberships(w, command);
  w.end_object();
}

void write_group(vbg::json_writer& w, const Group& group) {
  w.start_object();
  w.write_key("name");
  w.write_string(group.name);
  w.write_key("kind");
  w.write_string(group.kind == GroupKind::FEATURE ? "feature" : "extension");
  if (!group.number.empty()) {
    w.write_key("number");
    w.write_string(group.number);
  }
  if (!group.ext_type.empty()) {
    w.write_key("type");
    w.write_string(group.ext_type);
  }
  if (group.platform) {
    w.write_key("platform");
    w.write_string(group.platform->name);
  }
  if (!group.author.empty()) {
    w.write_key("author");
    w.write_string(group.author);
  }
  write_strings(w, "supported", group.supported);
  if (!group.depends.empty()) {
    w.write_key("depends");
    w.write_string(group.depends);
  }
  if (!group.promotedto.empty()) {
    w.write_key("promotedto");
    w.write_string(group.promotedto);
  }
  if (!group.deprecatedby.empty()) {
    w.write_key("deprecatedby");
    w.write_string(group.deprecatedby);
  }
  w.write_key("commands");
  w.start_array();
  for (const Command* command : group.commands) w.write_string(command->name);
  w.end_array();
  w.end_object();
}

}  // namespace

void write_json(vbg::json_writer& w, const Registry& registry) {
  w.start_object();
  w.write_key("api");
  w.write_string(registry.api);
  w.write_key("source");
  w.write_string(registry.source);
  w.write_key("header_version");
  if (registry.header_version)
    w.write_uint(*registry.header_version);
  else
    w.write_null();

  w.write_key("platforms");
  w.start_object();
  for (const auto& platform : registry.platforms) {
    w.write_key(platform->name);
    w.write_string(platform->protect);
  }
  w.end_object();

  w.write_key("constants");
  w.start_array();
  for (const auto& constant : registry.constants) {
    w.start_object();
    w.write_key("name");
    w.write_string(constant->name);
    w.write_key("value");
    w.write_string(constant->value);
    w.write_key("type");
    w.write_string(constant->c_type);
    write_memberships(w, *constant);
    w.end_object();
  }
  w.end_array();

  w.write_key("types");
  w.start_array();
  for (const auto& type : registry.types) write_type(w, *type);
  w.end_array();

  w.write_key("commands");
  w.start_array();
  for (const auto& command : registry.commands) write_command(w, *command);
  w.end_array();

  w.write_key("groups");
  w.start_array();
  for (const auto& group : registry.groups) write_group(w, *group);
  w.end_array();

  w.end_object();
}

}  // namespace vkr
