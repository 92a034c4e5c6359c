#include "emt/emitter.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <vector>

#include "emt/code_builder.h"
#include "emt/loader_expander.h"
#include "vbg/container.h"
#include "vbg/log.h"

namespace emt {
namespace {

// Condition under which a preamble item is needed: unconditional if any
// user is, otherwise the union of its users' platforms.
struct Need {
  bool portable = false;
  std::set<std::string> protects;

  void add(const std::set<std::string>& platforms) {
    if (portable) return;
    if (platforms.empty()) {
      portable = true;
      protects.clear();
      return;
    }
    protects.insert(platforms.begin(), platforms.end());
  }
};

// Preamble items keyed by name, kept in order of first use.
class NeedList {
 public:
  void add(const std::string& name, const std::set<std::string>& platforms) {
    auto it = index_.find(name);
    if (it == index_.end()) {
      index_[name] = items_.size();
      items_.emplace_back(name, Need());
      items_.back().second.add(platforms);
    } else {
      items_[it->second].second.add(platforms);
    }
  }

  const std::vector<std::pair<std::string, Need>>& items() const {
    return items_;
  }

 private:
  std::map<std::string, size_t> index_;
  std::vector<std::pair<std::string, Need>> items_;
};

void collect_tags(const vkr::Type& type, std::vector<std::string>& tags) {
  if (auto elaborated = dynamic_cast<const vkr::Elaborated*>(&type))
    tags.push_back(elaborated->tag);
  else if (auto c = dynamic_cast<const vkr::Const*>(&type))
    collect_tags(*c->T, tags);
  else if (auto pointer = dynamic_cast<const vkr::Pointer*>(&type))
    collect_tags(*pointer->T, tags);
  else if (auto array = dynamic_cast<const vkr::Array*>(&type))
    collect_tags(*array->T, tags);
}

std::vector<std::string> elaborated_tags(const vkr::Entity* entity) {
  std::vector<std::string> tags;
  auto params = [&](const vkr::Type& result,
                    const std::vector<vkr::Param>& ps) {
    collect_tags(result, tags);
    for (const vkr::Param& param : ps) collect_tags(*param.type, tags);
  };
  if (auto s = dynamic_cast<const vkr::Struct*>(entity)) {
    for (const vkr::Member& member : s->members)
      collect_tags(*member.type, tags);
  } else if (auto f = dynamic_cast<const vkr::FuncPointer*>(entity)) {
    params(*f->return_type, f->params);
  } else if (auto b = dynamic_cast<const vkr::BaseType*>(entity)) {
    if (b->underlying) collect_tags(*b->underlying, tags);
  } else if (auto c = dynamic_cast<const vkr::Command*>(entity)) {
    if (!c->alias) params(*c->return_type, c->params);
  }
  return tags;
}

// Opaque and preprocessor-defined base types live at global scope so that
// platform headers and the generated namespace agree on them.
bool global_scope(const vkr::TypeDef* type) {
  auto base = dynamic_cast<const vkr::BaseType*>(type);
  return base && !base->underlying;
}

std::string enumerator_value(const vkr::Enum& e,
                             const vkr::Enumerator& enumerator) {
  if (e.bitwidth == 64)
    return std::to_string(static_cast<uint64_t>(enumerator.value)) + "ULL";
  if (e.underlying_type() == "uint32_t")
    return std::to_string(static_cast<uint32_t>(enumerator.value)) + "U";
  return std::to_string(enumerator.value);
}

class HeaderEmitter {
 public:
  HeaderEmitter(const vkr::Registry& registry, const flt::Selection& selection,
                const EmitOptions& options)
      : registry_(registry), selection_(selection), options_(options) {}

  std::string emit() {
    preamble();
    global_declarations();
    out_.println("namespace ", options_.ns, " {");
    out_.println();
    versions();
    constants();
    forward_declarations();
    types();
    pfns();
    group_tables();
    level_tables();
    loaders();
    out_.println("}  // namespace ", options_.ns);
    out_.println();
    out_.println("#endif  // ", guard());
    return out_.str();
  }

 private:
  const std::set<std::string>& gate(const vkr::Entity* entity) const {
    return selection_.platforms(entity);
  }

  std::string guard() const {
    std::string result = "VKBINDGEN_";
    for (char c : identifier(options_.ns))
      result += std::toupper(static_cast<unsigned char>(c));
    return result + "_H_";
  }

  void preamble() {
    std::string source = options_.source_name;
    if (source.empty())
      source = std::filesystem::path(registry_.source).filename().string();
    out_.println("// Generated by vkbindgen from ", source, ". Do not edit.");
    out_.println();
    out_.println("#ifndef ", guard());
    out_.println("#define ", guard());
    out_.println();
    out_.println("#include <cstddef>");
    out_.println("#include <cstdint>");
    out_.println("#include <type_traits>");

    NeedList headers;
    for (const vkr::TypeDef* type : selection_.types)
      if (auto external = dynamic_cast<const vkr::External*>(type))
        if (!external->header.empty())
          headers.add(external->header, gate(type));
    for (const auto& [header, need] : headers.items()) {
      out_.open_gate(need.protects);
      out_.println("#include <", header, ">");
      out_.close_gate(need.protects);
    }
    out_.println();

    out_.println("#ifndef VKBINDGEN_CALL");
    out_.println("#if defined(_WIN32)");
    out_.println("#define VKBINDGEN_ATTR");
    out_.println("#define VKBINDGEN_CALL __stdcall");
    out_.println("#define VKBINDGEN_PTR VKBINDGEN_CALL");
    out_.println(
        "#elif defined(__ANDROID__) && defined(__ARM_ARCH) && "
        "__ARM_ARCH >= 7 && defined(__ARM_32BIT_STATE)");
    out_.println("#define VKBINDGEN_ATTR __attribute__((pcs(\"aapcs-vfp\")))");
    out_.println("#define VKBINDGEN_CALL");
    out_.println("#define VKBINDGEN_PTR VKBINDGEN_ATTR");
    out_.println("#else");
    out_.println("#define VKBINDGEN_ATTR");
    out_.println("#define VKBINDGEN_CALL");
    out_.println("#define VKBINDGEN_PTR");
    out_.println("#endif");
    out_.println("#endif");
    out_.println();
    out_.println("#ifndef VKBINDGEN_DEFINE_HANDLE");
    out_.println(
        "#define VKBINDGEN_DEFINE_HANDLE(object) "
        "typedef struct object##_T* object;");
    out_.println("#endif");
    out_.println();
    out_.println("#ifndef VKBINDGEN_DEFINE_NON_DISPATCHABLE_HANDLE");
    out_.println(
        "#if defined(__LP64__) || defined(_WIN64) || "
        "(defined(__x86_64__) && !defined(__ILP32__)) || defined(_M_X64) || "
        "defined(__ia64) || defined(_M_IA64) || defined(__aarch64__) || "
        "defined(__powerpc64__) || (defined(__riscv) && __riscv_xlen == 64)");
    out_.println(
        "#define VKBINDGEN_DEFINE_NON_DISPATCHABLE_HANDLE(object) "
        "typedef struct object##_T* object;");
    out_.println("#else");
    out_.println(
        "#define VKBINDGEN_DEFINE_NON_DISPATCHABLE_HANDLE(object) "
        "typedef uint64_t object;");
    out_.println("#endif");
    out_.println("#endif");
    out_.println();
  }

  void global_declarations() {
    bool any = false;
    for (const vkr::TypeDef* type : selection_.types) {
      if (!global_scope(type)) continue;
      auto base = static_cast<const vkr::BaseType*>(type);
      out_.open_gate(gate(type));
      if (base->opaque)
        out_.println("struct ", base->name, ";");
      else
        out_.println(base->verbatim);
      out_.close_gate(gate(type));
      any = true;
    }

    NeedList tags;
    auto add_tags = [&](const vkr::Entity* entity) {
      for (const std::string& tag : elaborated_tags(entity))
        tags.add(tag, gate(entity));
    };
    for (const vkr::TypeDef* type : selection_.types) add_tags(type);
    for (const vkr::Command* command : selection_.commands) add_tags(command);
    for (const auto& [tag, need] : tags.items()) {
      out_.open_gate(need.protects);
      out_.println("struct ", tag, ";");
      out_.close_gate(need.protects);
      any = true;
    }
    if (any) out_.println();
  }

  void versions() {
    if (registry_.header_version)
      out_.println("constexpr uint32_t header_version = ",
                   *registry_.header_version, ";");
    out_.println();
    out_.println(
        "constexpr uint32_t make_api_version(uint32_t variant, uint32_t major,");
    out_.println("                                   uint32_t minor, uint32_t patch) {");
    out_.indent();
    out_.println(
        "return (variant << 29U) | (major << 22U) | (minor << 12U) | patch;");
    out_.dedent();
    out_.println("}");
    out_.println();
  }

  void constants() {
    for (const vkr::Constant* constant : selection_.constants) {
      out_.open_gate(gate(constant));
      out_.println("constexpr ", constant->c_type, " ", constant->name, " = ",
                   constant->value, ";");
      out_.close_gate(gate(constant));
    }
    if (!selection_.constants.empty()) out_.println();
  }

  void forward_declarations() {
    bool any = false;
    for (const vkr::TypeDef* type : selection_.types) {
      auto s = dynamic_cast<const vkr::Struct*>(type);
      if (!s) continue;
      out_.open_gate(gate(s));
      out_.println(s->is_union ? "union " : "struct ", s->name, ";");
      out_.close_gate(gate(s));
      any = true;
    }
    if (any) out_.println();
  }

  void types() {
    for (const vkr::TypeDef* type : selection_.types) {
      if (global_scope(type) || type->kind() == vkr::TypeKind::PRIMITIVE ||
          type->kind() == vkr::TypeKind::EXTERNAL)
        continue;
      out_.open_gate(gate(type));
      type_definition(type);
      out_.close_gate(gate(type));
    }
    out_.println();
  }

  void type_definition(const vkr::TypeDef* type) {
    switch (type->kind()) {
      case vkr::TypeKind::BASETYPE: {
        auto base = static_cast<const vkr::BaseType*>(type);
        out_.println("using ", base->name, " = ", base->underlying->to_string(),
                     ";");
        return;
      }
      case vkr::TypeKind::BITMASK: {
        auto bitmask = static_cast<const vkr::Bitmask*>(type);
        out_.println("using ", bitmask->name, " = ", bitmask->flags->name, ";");
        return;
      }
      case vkr::TypeKind::ENUM:
        enum_definition(*static_cast<const vkr::Enum*>(type));
        return;
      case vkr::TypeKind::HANDLE: {
        auto handle = static_cast<const vkr::Handle*>(type);
        out_.println(handle->dispatchable
                         ? "VKBINDGEN_DEFINE_HANDLE("
                         : "VKBINDGEN_DEFINE_NON_DISPATCHABLE_HANDLE(",
                     handle->name, ")");
        return;
      }
      case vkr::TypeKind::STRUCT:
      case vkr::TypeKind::UNION:
        struct_definition(*static_cast<const vkr::Struct*>(type));
        return;
      case vkr::TypeKind::FUNCPOINTER: {
        auto f = static_cast<const vkr::FuncPointer*>(type);
        out_.println("using ", f->name, " = ",
                     vkr::signature_string(*f->return_type, f->params,
                                           "VKBINDGEN_PTR"),
                     ";");
        return;
      }
      case vkr::TypeKind::ALIAS: {
        auto alias = static_cast<const vkr::Alias*>(type);
        out_.println("using ", alias->name, " = ", alias->target->name, ";");
        return;
      }
      case vkr::TypeKind::PRIMITIVE:
      case vkr::TypeKind::EXTERNAL:
        break;
    }
    VBG_FATAL("no definition for ", type->name);
  }

  void enum_definition(const vkr::Enum& e) {
    const std::set<std::string>& outer = gate(&e);
    std::vector<const vkr::Enumerator*> enumerators = selection_.enumerators(&e);

    if (e.bitwidth == 64) {
      out_.println("using ", e.name, " = uint64_t;");
      for (const vkr::Enumerator* enumerator : enumerators) {
        std::set<std::string> inner = nested_gate(outer, gate(enumerator));
        out_.open_gate(inner);
        out_.println("constexpr ", e.name, " ", enumerator->name, " = ",
                     enumerator_value(e, *enumerator), ";");
        out_.close_gate(inner);
      }
      return;
    }

    out_.println("enum ", e.name, " : ", e.underlying_type(), " {");
    out_.indent();
    for (const vkr::Enumerator* enumerator : enumerators) {
      std::set<std::string> inner = nested_gate(outer, gate(enumerator));
      out_.open_gate(inner);
      out_.println(enumerator->name, " = ", enumerator_value(e, *enumerator),
                   ",");
      out_.close_gate(inner);
    }
    out_.dedent();
    out_.println("};");
  }

  void struct_definition(const vkr::Struct& s) {
    out_.println(s.is_union ? "union " : "struct ", s.name, " {");
    out_.indent();
    for (const vkr::Member& member : s.members) {
      if (member.bitfield_width)
        out_.println(member.type->declare(member.name), " : ",
                     *member.bitfield_width, ";");
      else
        out_.println(member.type->declare(member.name), ";");
    }
    out_.dedent();
    out_.println("};");
  }

  void pfns() {
    for (const vkr::Command* command : selection_.commands) {
      if (command->alias) continue;
      out_.open_gate(gate(command));
      out_.println("using PFN_", command->name, " = ",
                   vkr::signature_string(*command->return_type,
                                         command->params, "VKBINDGEN_PTR"),
                   ";");
      out_.close_gate(gate(command));
    }
    for (const vkr::Command* command : selection_.commands) {
      if (!command->alias) continue;
      out_.open_gate(gate(command));
      out_.println("using PFN_", command->name, " = PFN_",
                   command->definition().name, ";");
      out_.close_gate(gate(command));
    }
    out_.println();
  }

  void table(const std::string& name, const std::vector<LoadEntry>& entries) {
    out_.println("struct ", name, " {");
    out_.indent();
    for (const LoadEntry& entry : entries) {
      out_.open_gate(entry.platforms());
      out_.println("PFN_", entry.command().name, " ", entry.field(),
                   " = nullptr;");
      out_.close_gate(entry.platforms());
    }
    out_.dedent();
    out_.println("};");
    out_.println();
    expand_visitor(out_, name, entries);
    out_.println();
  }

  void group_tables() {
    for (const vkr::Group* group : selection_.groups) {
      std::vector<const vkr::Command*> commands = selection_.commands_of(group);
      if (commands.empty()) continue;
      std::set<std::string> group_gate;
      if (group->platform) group_gate.insert(group->platform->protect);

      std::string name = identifier(group->name) + "_commands";
      std::vector<LoadEntry> entries;
      for (const vkr::Command* command : commands)
        entries.emplace_back(name, *command,
                             nested_gate(group_gate, gate(command)));
      VLOG(1) << name << ": " << entries.size() << " commands";

      out_.open_gate(group_gate);
      table(name, entries);
      out_.close_gate(group_gate);
    }
  }

  void level_tables() {
    for (vkr::DispatchLevel level :
         {vkr::DispatchLevel::GLOBAL, vkr::DispatchLevel::INSTANCE,
          vkr::DispatchLevel::DEVICE}) {
      std::string name = std::string(vkr::to_string(level)) + "_commands";
      std::vector<LoadEntry> entries;
      for (const vkr::Command* command : selection_.commands)
        if (command->level == level)
          entries.emplace_back(name, *command, gate(command));
      table(name, entries);
    }

    out_.println("template <class Table, class Resolve, class Handle>");
    out_.println(
        "void load_commands(Table& table, Resolve&& resolve, Handle handle) {");
    out_.indent();
    out_.println("visit_commands(table, [&](auto& field, const char* name) {");
    out_.indent();
    out_.println("field = reinterpret_cast<std::remove_reference_t<decltype(field)>>(");
    out_.println("    resolve(handle, name));");
    out_.dedent();
    out_.println("});");
    out_.dedent();
    out_.println("}");
    out_.println();
  }

  bool kept(const std::string& name) const {
    const vkr::Entity* entity = registry_.find(name);
    return entity && selection_.kept(entity);
  }

  // A loader needs both its entry point and its handle type.
  std::set<std::string> loader_gate(const std::string& command,
                                    const std::string& handle) const {
    std::set<std::string> result = gate(registry_.find(command));
    const std::set<std::string>& handle_gate = gate(registry_.find(handle));
    result.insert(handle_gate.begin(), handle_gate.end());
    return result;
  }

  void loaders() {
    if (kept("vkGetInstanceProcAddr") && kept("VkInstance")) {
      std::set<std::string> g = loader_gate("vkGetInstanceProcAddr", "VkInstance");
      out_.open_gate(g);
      out_.println(
          "inline global_commands load_global_commands("
          "PFN_vkGetInstanceProcAddr gipa) {");
      out_.indent();
      out_.println("global_commands table;");
      out_.println("load_commands(table, gipa, VkInstance{});");
      out_.println("return table;");
      out_.dedent();
      out_.println("}");
      out_.println();
      out_.println(
          "inline instance_commands load_instance_commands(");
      out_.println("    PFN_vkGetInstanceProcAddr gipa, VkInstance instance) {");
      out_.indent();
      out_.println("instance_commands table;");
      out_.println("load_commands(table, gipa, instance);");
      out_.println("return table;");
      out_.dedent();
      out_.println("}");
      out_.close_gate(g);
      out_.println();
    } else {
      LOG(WARNING) << "vkGetInstanceProcAddr or VkInstance not selected; "
                      "no global or instance loader emitted";
    }

    if (kept("vkGetDeviceProcAddr") && kept("VkDevice")) {
      std::set<std::string> g = loader_gate("vkGetDeviceProcAddr", "VkDevice");
      out_.open_gate(g);
      out_.println("inline device_commands load_device_commands(");
      out_.println("    PFN_vkGetDeviceProcAddr gdpa, VkDevice device) {");
      out_.indent();
      out_.println("device_commands table;");
      out_.println("load_commands(table, gdpa, device);");
      out_.println("return table;");
      out_.dedent();
      out_.println("}");
      out_.close_gate(g);
      out_.println();
    } else {
      LOG(WARNING) << "vkGetDeviceProcAddr or VkDevice not selected; "
                      "no device loader emitted";
    }
  }

  const vkr::Registry& registry_;
  const flt::Selection& selection_;
  const EmitOptions& options_;
  code_builder out_;
};

}  // namespace

std::string identifier(const std::string& name) {
  std::string result;
  for (char c : name)
    result += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
  if (result.empty() || std::isdigit(static_cast<unsigned char>(result[0])))
    result = "_" + result;
  return result;
}

std::set<std::string> nested_gate(const std::set<std::string>& outer,
                                  const std::set<std::string>& inner) {
  if (inner.empty()) return {};
  if (!outer.empty() &&
      std::all_of(outer.begin(), outer.end(), [&](const std::string& p) {
        return vbg::contains(inner, p);
      }))
    return {};
  return inner;
}

std::string emit_header(const vkr::Registry& registry,
                        const flt::Selection& selection,
                        const EmitOptions& options) {
  std::string header = HeaderEmitter(registry, selection, options).emit();
  LOG(INFO) << "emitted " << header.size() << " bytes for "
            << selection.types.size() << " types and "
            << selection.commands.size() << " commands";
  return header;
}

}  // namespace emt
