#include "emt/abi_check_emitter.h"

#include <set>

#include "emt/code_builder.h"
#include "vbg/log.h"

namespace emt {
namespace {

// vulkan.h defines API constants as macros, so captured values are named
// with a prefix the macros cannot match.
std::string captured(const vkr::Constant* constant) {
  return "abi_values::constant_" + constant->name;
}

class AbiCheckEmitter {
 public:
  AbiCheckEmitter(const flt::Selection& selection, const EmitOptions& options)
      : selection_(selection), options_(options) {}

  std::string emit(const std::string& header_include) {
    out_.println("// Generated by vkbindgen. Do not edit.");
    out_.println();

    std::set<std::string> protects;
    for (const vkr::Group* group : selection_.groups)
      if (group->platform) protects.insert(group->platform->protect);
    for (const std::string& protect : protects) {
      out_.println("#ifndef ", protect);
      out_.println("#define ", protect);
      out_.println("#endif");
    }
    if (!protects.empty()) out_.println();

    out_.println("#include \"", header_include, "\"");
    out_.println("#include \"test/abitest.h\"");
    out_.println();

    out_.println("namespace abi_values {");
    for (const vkr::Constant* constant : selection_.constants) {
      out_.open_gate(gate(constant));
      out_.println("constexpr auto constant_", constant->name, " = ",
                   ours(constant->name), ";");
      out_.close_gate(gate(constant));
    }
    out_.println("}  // namespace abi_values");
    out_.println();
    out_.println("#include <vulkan/vulkan.h>");
    out_.println();

    for (const vkr::Constant* constant : selection_.constants) {
      out_.open_gate(gate(constant));
      out_.println("ABITEST_CHECK_CONSTANT(", captured(constant), ", ",
                   constant->name, ")");
      out_.close_gate(gate(constant));
    }
    for (const vkr::TypeDef* type : selection_.types) {
      out_.open_gate(gate(type));
      check(type);
      out_.close_gate(gate(type));
    }
    for (const vkr::Command* command : selection_.commands) {
      out_.open_gate(gate(command));
      out_.println("ABITEST_CHECK_FUNCPOINTER(", ours("PFN_" + command->name),
                   ", PFN_", command->name, ")");
      out_.close_gate(gate(command));
    }
    out_.println();
    out_.println("ABITEST_MAIN");
    return out_.str();
  }

 private:
  const std::set<std::string>& gate(const vkr::Entity* entity) const {
    return selection_.platforms(entity);
  }

  std::string ours(const std::string& name) const {
    return options_.ns + "::" + name;
  }

  void check(const vkr::TypeDef* type) {
    switch (type->kind()) {
      case vkr::TypeKind::PRIMITIVE:
      case vkr::TypeKind::EXTERNAL:
        return;
      case vkr::TypeKind::BASETYPE:
        // Opaque and verbatim base types are shared, not redeclared.
        if (!static_cast<const vkr::BaseType*>(type)->underlying) return;
        size(type);
        return;
      case vkr::TypeKind::BITMASK:
      case vkr::TypeKind::HANDLE:
      case vkr::TypeKind::ALIAS:
        size(type);
        return;
      case vkr::TypeKind::ENUM: {
        auto e = static_cast<const vkr::Enum*>(type);
        size(type);
        for (const vkr::Enumerator* enumerator : selection_.enumerators(e)) {
          std::set<std::string> inner =
              nested_gate(gate(type), gate(enumerator));
          out_.open_gate(inner);
          out_.println("ABITEST_CHECK_ENUMERATOR(", ours(enumerator->name),
                       ", ", enumerator->name, ")");
          out_.close_gate(inner);
        }
        return;
      }
      case vkr::TypeKind::STRUCT:
      case vkr::TypeKind::UNION: {
        auto s = static_cast<const vkr::Struct*>(type);
        out_.println("ABITEST_CHECK_STRUCT(", ours(s->name), ", ", s->name,
                     ")");
        for (const vkr::Member& member : s->members) {
          if (member.bitfield_width) continue;
          out_.println("ABITEST_CHECK_STRUCT_MEMBER(", ours(s->name), ", ",
                       s->name, ", ", member.name, ")");
        }
        return;
      }
      case vkr::TypeKind::FUNCPOINTER:
        out_.println("ABITEST_CHECK_FUNCPOINTER(", ours(type->name), ", ",
                     type->name, ")");
        return;
    }
  }

  void size(const vkr::TypeDef* type) {
    out_.println("ABITEST_CHECK_SIZE(", ours(type->name), ", ", type->name,
                 ")");
  }

  const flt::Selection& selection_;
  const EmitOptions& options_;
  code_builder out_;
};

}  // namespace

std::string emit_abi_check(const vkr::Registry& registry,
                           const flt::Selection& selection,
                           const EmitOptions& options,
                           const std::string& header_include) {
  std::string unit =
      AbiCheckEmitter(selection, options).emit(header_include);
  VLOG(1) << "ABI check for " << registry.source << ": " << unit.size()
          << " bytes";
  return unit;
}

}  // namespace emt
