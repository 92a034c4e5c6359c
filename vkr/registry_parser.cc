#include "vkr/registry_parser.h"

#include <tinyxml2.h>

#include <algorithm>
#include <cctype>
#include <limits>
#include <unordered_map>
#include <unordered_set>

#include "cdp/cdecl_parser.h"
#include "vbg/container.h"
#include "vbg/error.h"
#include "vbg/file.h"
#include "vbg/log.h"
#include "vbg/string.h"
#include "vkr/depends.h"

namespace vkr {
namespace {

using Element = const tinyxml2::XMLElement*;

constexpr int64_t kExtensionEnumBase = 1000000000;
constexpr int64_t kExtensionEnumBlock = 1000;
constexpr size_t kMaxAliasDepth = 16;

template <typename F>
void foreach_child(Element parent, const char* name, F f) {
  for (Element e = parent->FirstChildElement(name); e;
       e = e->NextSiblingElement(name))
    f(e);
}

std::string attribute(Element e, const char* name) {
  const char* value = e->Attribute(name);
  return value ? value : "";
}

// Text of all descendant text nodes, <comment> elements excluded. Adjacent
// words from different nodes are kept apart by a space.
void collect_text(const tinyxml2::XMLNode* node, std::string& out,
                  bool separate) {
  for (auto child = node->FirstChild(); child; child = child->NextSibling()) {
    if (auto text = child->ToText()) {
      std::string s = text->Value();
      if (separate && !out.empty() && !s.empty() &&
          (std::isalnum((unsigned char)out.back()) || out.back() == '_') &&
          (std::isalnum((unsigned char)s.front()) || s.front() == '_'))
        out += ' ';
      out += s;
    } else if (auto element = child->ToElement()) {
      if (std::string_view(element->Name()) == "comment") continue;
      collect_text(element, out, separate);
    }
  }
}

std::string inner_text(Element e) {
  std::string text;
  collect_text(e, text, true);
  return vbg::squeeze(text);
}

std::string raw_text(Element e) {
  std::string text;
  collect_text(e, text, false);
  return vbg::trim(text);
}

std::string child_text(Element e, const char* name) {
  Element child = e->FirstChildElement(name);
  if (!child) return "";
  return inner_text(child);
}

// The name attribute, or the <name> child used by types written as C.
std::string element_name(Element e) {
  std::string name = attribute(e, "name");
  if (!name.empty()) return name;
  return child_text(e, "name");
}

std::string element_path(Element e) {
  std::vector<std::string> parts;
  for (const tinyxml2::XMLNode* node = e; node && node->ToElement();
       node = node->Parent())
    parts.push_back(node->ToElement()->Name());
  std::reverse(parts.begin(), parts.end());
  std::string path = vbg::join("/", parts);
  std::string name = element_name(e);
  if (!name.empty()) path += "[" + name + "]";
  return path;
}

std::string infer_constant_type(const std::string& value) {
  if (vbg::startswith(value, "\"")) return "const char*";
  std::string upper = value;
  for (char& c : upper) c = std::toupper((unsigned char)c);
  if (upper.find("ULL") != std::string::npos) return "uint64_t";
  if (upper.find('.') != std::string::npos) return "float";
  if (upper.find('U') != std::string::npos) return "uint32_t";
  std::optional<int64_t> number = parse_c_integer(value);
  if (number && *number < 0) return "int32_t";
  return "uint32_t";
}

class RegistryParser {
 public:
  RegistryParser(const std::string& source, const ParseOptions& options)
      : source_(source), options_(options) {
    registry_.api = options.api;
    registry_.source = source;
  }

  Registry parse(const tinyxml2::XMLDocument& doc) {
    Element root = doc.RootElement();
    if (!root || std::string_view(root->Name()) != "registry")
      throw vbg::malformed_registry("root element is not <registry>",
                                    source_);

    foreach_child(root, "platforms", [&](Element e) { parse_platforms(e); });
    foreach_child(root, "tags", [&](Element e) { parse_tags(e); });
    foreach_child(root, "types", [&](Element e) { declare_types(e); });
    foreach_child(root, "enums", [&](Element e) { parse_enums(e); });
    // Aliases first: other definitions follow them through canonical().
    for (const auto& [e, type] : declared_types_)
      if (type->kind() == TypeKind::ALIAS) define_type(e, type);
    check_type_alias_cycles();
    for (const auto& [e, type] : declared_types_)
      if (type->kind() != TypeKind::ALIAS) define_type(e, type);
    foreach_child(root, "commands", [&](Element e) { parse_commands(e); });
    resolve_command_aliases();
    foreach_child(root, "feature", [&](Element e) { parse_feature(e); });
    foreach_child(root, "extensions", [&](Element e) { parse_extensions(e); });
    resolve_enumerator_aliases();
    resolve_constant_aliases();
    assign_dispatch_levels();
    check_header_version();

    LOG(INFO) << "parsed " << source_ << ": " << registry_.types.size()
              << " types, " << registry_.enumerators.size()
              << " enumerators, " << registry_.constants.size()
              << " constants, " << registry_.commands.size() << " commands, "
              << registry_.groups.size() << " groups";
    return std::move(registry_);
  }

 private:
  std::string location(Element e) const {
    return vbg::concat(source_, ":", e->GetLineNum(), " (", element_path(e),
                       ")");
  }

  template <typename... Args>
  [[noreturn]] void fail(Element e, Args&&... args) const {
    throw vbg::malformed_registry(vbg::concat(std::forward<Args>(args)...),
                                  location(e));
  }

  std::string required_attribute(Element e, const char* name) const {
    const char* value = e->Attribute(name);
    if (!value) fail(e, "missing required attribute '", name, "'");
    return value;
  }

  // Elements restricted to other APIs (e.g. vulkansc) are invisible.
  bool selected(Element e) const {
    const char* api = e->Attribute("api");
    if (!api) return true;
    std::vector<std::string> apis = vbg::split(",", api);
    return std::find(apis.begin(), apis.end(), options_.api) != apis.end();
  }

  void declare(Element e, Entity* entity) {
    entity->index = next_index_++;
    entity->line = e->GetLineNum();
    if (!registry_.entities.emplace(entity->name, entity).second)
      fail(e, "duplicate definition of ", entity->name);
  }

  template <class T>
  T* add_type(Element e, const std::string& name) {
    auto type = std::make_unique<T>();
    T* result = type.get();
    result->name = name;
    declare(e, result);
    registry_.types.push_back(std::move(type));
    declared_types_.emplace_back(e, result);
    return result;
  }

  const TypeDef* lookup_type(Element e, const std::string& name) const {
    auto type = dynamic_cast<const TypeDef*>(registry_.find(name));
    if (!type) fail(e, "unknown type ", name);
    return type;
  }

  void parse_platforms(Element platforms) {
    foreach_child(platforms, "platform", [&](Element e) {
      auto platform = std::make_unique<Platform>();
      platform->name = required_attribute(e, "name");
      platform->protect = required_attribute(e, "protect");
      if (!registry_.platform_map.emplace(platform->name, platform.get())
               .second)
        fail(e, "duplicate platform ", platform->name);
      registry_.platforms.push_back(std::move(platform));
    });
  }

  void parse_tags(Element tags) {
    foreach_child(tags, "tag", [&](Element e) {
      auto tag = std::make_unique<Tag>();
      tag->name = required_attribute(e, "name");
      tag->author = attribute(e, "author");
      registry_.tags.push_back(std::move(tag));
    });
  }

  // First pass over <types>: creates every TypeDef so that later passes can
  // resolve references regardless of document order.
  void declare_types(Element types) {
    foreach_child(types, "type", [&](Element e) {
      if (!selected(e)) return;
      std::string category = attribute(e, "category");
      std::string name = element_name(e);
      if (name.empty()) fail(e, "type without a name");

      if (e->Attribute("alias")) {
        add_type<Alias>(e, name)->category = category;
        return;
      }

      if (category.empty()) {
        std::string requires_header = attribute(e, "requires");
        if (requires_header.empty() || requires_header == "vk_platform")
          add_type<Primitive>(e, name);
        else
          add_type<External>(e, name)->header = requires_header;
      } else if (category == "include") {
        ignored_types_.insert(name);
      } else if (category == "define") {
        ignored_types_.insert(name);
        if (name == "VK_HEADER_VERSION") parse_header_version(e);
      } else if (category == "basetype") {
        add_type<BaseType>(e, name);
      } else if (category == "bitmask") {
        add_type<Bitmask>(e, name);
      } else if (category == "handle") {
        add_type<Handle>(e, name);
      } else if (category == "enum") {
        add_type<Enum>(e, name);
      } else if (category == "funcpointer") {
        add_type<FuncPointer>(e, name);
      } else if (category == "struct" || category == "union") {
        add_type<Struct>(e, name)->is_union = (category == "union");
      } else {
        fail(e, "unknown category '", category, "'");
      }
    });
  }

  void parse_header_version(Element e) {
    std::vector<std::string> words =
        vbg::split_nonempty(" ", inner_text(e));
    std::optional<int64_t> version;
    if (!words.empty()) version = parse_c_integer(words.back());
    if (!version || *version < 0) fail(e, "unparseable VK_HEADER_VERSION");
    registry_.header_version = static_cast<uint32_t>(*version);
  }

  // Second pass over <types>: fills in definitions.
  void define_type(Element e, TypeDef* type) {
    VLOG(1) << "defining " << to_string(type->kind()) << " " << type->name;
    switch (type->kind()) {
      case TypeKind::PRIMITIVE:
      case TypeKind::EXTERNAL:
      case TypeKind::ENUM:
        break;
      case TypeKind::ALIAS: {
        auto alias = static_cast<Alias*>(type);
        std::string target = attribute(e, "alias");
        alias->target = dynamic_cast<const TypeDef*>(registry_.find(target));
        if (!alias->target) fail(e, "alias of unknown type ", target);
        break;
      }
      case TypeKind::BASETYPE:
        define_basetype(e, static_cast<BaseType*>(type));
        break;
      case TypeKind::BITMASK: {
        auto bitmask = static_cast<Bitmask*>(type);
        bitmask->bitvalues = attribute(e, "bitvalues");
        if (bitmask->bitvalues.empty())
          bitmask->bitvalues = attribute(e, "requires");
        std::string flags = child_text(e, "type");
        if (flags.empty()) fail(e, "bitmask without a flags type");
        bitmask->flags = lookup_type(e, flags);
        break;
      }
      case TypeKind::HANDLE:
        define_handle(e, static_cast<Handle*>(type));
        break;
      case TypeKind::STRUCT:
      case TypeKind::UNION:
        define_struct(e, static_cast<Struct*>(type));
        break;
      case TypeKind::FUNCPOINTER:
        define_funcpointer(e, static_cast<FuncPointer*>(type));
        break;
    }
  }

  void define_basetype(Element e, BaseType* basetype) {
    std::string raw = raw_text(e);
    if (raw.find('#') != std::string::npos) {
      LOG(WARNING) << basetype->name
                   << " is defined by preprocessor text, emitting verbatim";
      basetype->verbatim = raw;
      return;
    }
    std::string code = inner_text(e);
    if (std::optional<std::string> tag = cdp::parse_opaque_struct(code)) {
      if (*tag != basetype->name)
        fail(e, "opaque struct ", *tag, " does not match ", basetype->name);
      basetype->opaque = true;
      return;
    }
    if (!vbg::startswith(code, "typedef"))
      fail(e, "unparseable base type '", code, "'");
    cdp::Declaration decl = cdp::parse_typedef(code, location(e));
    if (decl.name != basetype->name)
      fail(e, "typedef name ", decl.name, " does not match ", basetype->name);
    basetype->underlying = translate_type(e, *decl.type);
  }

  void define_handle(Element e, Handle* handle) {
    std::string macro = child_text(e, "type");
    if (macro == "VK_DEFINE_HANDLE")
      handle->dispatchable = true;
    else if (macro == "VK_DEFINE_NON_DISPATCHABLE_HANDLE")
      handle->dispatchable = false;
    else
      fail(e, "unknown handle macro '", macro, "'");
    for (const std::string& parent_name :
         vbg::split_nonempty(",", attribute(e, "parent"))) {
      auto parent = dynamic_cast<const Handle*>(
          lookup_type(e, parent_name)->canonical());
      if (!parent) fail(e, "parent ", parent_name, " is not a handle");
      handle->parents.push_back(parent);
    }
    handle->objtypeenum = attribute(e, "objtypeenum");
  }

  void define_struct(Element e, Struct* s) {
    s->returnedonly = (attribute(e, "returnedonly") == "true");
    s->structextends = vbg::split_nonempty(",", attribute(e, "structextends"));
    foreach_child(e, "member", [&](Element m) {
      if (!selected(m)) return;
      cdp::Declaration decl =
          cdp::parse_declaration(inner_text(m), location(m));
      std::string name = child_text(m, "name");
      if (decl.name != name)
        fail(m, "member declarator ", decl.name, " does not match ", name);
      Member member;
      member.name = decl.name;
      member.type = translate_type(m, *decl.type);
      member.bitfield_width = decl.bitfield_width;
      member.values = attribute(m, "values");
      member.len = attribute(m, "len");
      member.optional = vbg::startswith(attribute(m, "optional"), "true");
      s->members.push_back(std::move(member));
    });
    if (s->members.empty()) fail(e, s->name, " has no members");
  }

  void define_funcpointer(Element e, FuncPointer* funcpointer) {
    std::string code;
    if (Element proto = e->FirstChildElement("proto")) {
      std::string proto_text = inner_text(proto);
      if (proto_text.find('(') == std::string::npos) {
        std::string name = child_text(proto, "name");
        size_t pos = proto_text.rfind(name);
        if (name.empty() || pos == std::string::npos)
          fail(proto, "function pointer prototype without a name");
        proto_text = vbg::trim(proto_text.substr(0, pos)) + " (VKAPI_PTR *" +
                     name + ")";
      }
      std::vector<std::string> params;
      foreach_child(e, "param", [&](Element p) {
        if (selected(p)) params.push_back(inner_text(p));
      });
      if (params.empty()) params.push_back("void");
      code = "typedef " + proto_text + "(" + vbg::join(", ", params) + ");";
    } else {
      code = inner_text(e);
    }
    cdp::FunctionPrototype prototype =
        cdp::parse_function_prototype(code, location(e));
    if (prototype.name != funcpointer->name)
      fail(e, "function pointer ", prototype.name, " does not match ",
           funcpointer->name);
    funcpointer->return_type = translate_type(e, *prototype.return_type);
    for (cdp::Declaration& decl : prototype.params) {
      Param param;
      param.name = decl.name;
      param.type = translate_type(e, *decl.type);
      funcpointer->params.push_back(std::move(param));
    }
  }

  std::unique_ptr<Expr> translate_expr(Element e, const cdp::Expr& expr) {
    if (auto number = dynamic_cast<const cdp::Number*>(&expr)) {
      auto result = std::make_unique<Number>();
      result->number = number->number;
      return result;
    }
    auto& reference = dynamic_cast<const cdp::Reference&>(expr);
    auto constant =
        dynamic_cast<const Constant*>(registry_.find(reference.name));
    if (!constant) fail(e, "unknown constant ", reference.name);
    auto result = std::make_unique<Reference>();
    result->entity = constant;
    return result;
  }

  std::unique_ptr<Type> translate_type(Element e, const cdp::Type& type) {
    if (auto name = dynamic_cast<const cdp::Name*>(&type)) {
      auto entity = dynamic_cast<const TypeDef*>(registry_.find(name->name));
      if (!entity) {
        if (!name->elaborated) fail(e, "unknown type ", name->name);
        auto result = std::make_unique<Elaborated>();
        result->tag = name->name;
        return result;
      }
      auto result = std::make_unique<Name>();
      result->entity = entity;
      return result;
    }
    if (auto c = dynamic_cast<const cdp::Const*>(&type)) {
      auto result = std::make_unique<Const>();
      result->T = translate_type(e, *c->T);
      return result;
    }
    if (auto pointer = dynamic_cast<const cdp::Pointer*>(&type)) {
      auto result = std::make_unique<Pointer>();
      result->T = translate_type(e, *pointer->T);
      return result;
    }
    auto& array = dynamic_cast<const cdp::Array&>(type);
    auto result = std::make_unique<Array>();
    result->T = translate_type(e, *array.T);
    result->N = translate_expr(e, *array.N);
    return result;
  }

  // Computes the value of an <enum> element; nullopt for aliases.
  std::optional<int64_t> enum_value(Element e, const std::string& extnumber) {
    if (e->Attribute("value")) {
      std::string text = attribute(e, "value");
      std::optional<int64_t> value = parse_c_integer(text);
      if (!value) fail(e, "unparseable enum value '", text, "'");
      return value;
    }
    if (e->Attribute("bitpos")) {
      std::optional<int64_t> bitpos = parse_c_integer(attribute(e, "bitpos"));
      if (!bitpos || *bitpos < 0 || *bitpos > 63) fail(e, "bad bitpos");
      return int64_t(uint64_t(1) << *bitpos);
    }
    if (e->Attribute("offset")) {
      std::string number = attribute(e, "extnumber");
      if (number.empty()) number = extnumber;
      if (number.empty()) fail(e, "offset without an extension number");
      std::optional<int64_t> ext = parse_c_integer(number);
      std::optional<int64_t> offset = parse_c_integer(attribute(e, "offset"));
      if (!ext || !offset || *ext < 1) fail(e, "bad extension enum offset");
      int64_t value =
          kExtensionEnumBase + (*ext - 1) * kExtensionEnumBlock + *offset;
      std::string dir = attribute(e, "dir");
      if (dir == "-")
        value = -value;
      else if (!dir.empty())
        fail(e, "bad dir '", dir, "'");
      return value;
    }
    if (e->Attribute("alias")) return std::nullopt;
    fail(e, "enum has no value");
  }

  Enumerator* add_enumerator(Element e, const std::string& name, Enum* parent,
                             const std::string& extnumber) {
    auto enumerator = std::make_unique<Enumerator>();
    Enumerator* result = enumerator.get();
    result->name = name;
    result->parent = parent;
    std::optional<int64_t> value = enum_value(e, extnumber);
    if (value)
      result->value = *value;
    else
      enumerator_aliases_.emplace_back(e, result);
    declare(e, result);
    parent->enumerators.push_back(result);
    registry_.enumerators.push_back(std::move(enumerator));
    return result;
  }

  Constant* add_constant(Element e, const std::string& name) {
    auto constant = std::make_unique<Constant>();
    Constant* result = constant.get();
    result->name = name;
    if (e->Attribute("alias")) {
      constant_aliases_.emplace_back(e, result);
    } else {
      result->value = required_attribute(e, "value");
      result->c_type = attribute(e, "type");
      if (result->c_type.empty())
        result->c_type = infer_constant_type(result->value);
    }
    declare(e, result);
    registry_.constants.push_back(std::move(constant));
    return result;
  }

  void parse_enums(Element enums) {
    if (!selected(enums)) return;
    std::string name = required_attribute(enums, "name");
    std::string type = attribute(enums, "type");

    if (name == "API Constants" || type == "constants") {
      foreach_child(enums, "enum", [&](Element e) {
        if (!selected(e)) return;
        registry_level_.insert(add_constant(e, required_attribute(e, "name")));
      });
      return;
    }

    auto parent =
        dynamic_cast<Enum*>(vbg::find_or_null(registry_.entities, name));
    if (!parent) fail(enums, "no enum type named ", name);
    parent->is_bitmask = (type == "bitmask");
    if (enums->Attribute("bitwidth")) {
      std::optional<int64_t> bitwidth =
          parse_c_integer(attribute(enums, "bitwidth"));
      if (!bitwidth || (*bitwidth != 32 && *bitwidth != 64))
        fail(enums, "bad bitwidth");
      parent->bitwidth = static_cast<int>(*bitwidth);
    }
    foreach_child(enums, "enum", [&](Element e) {
      if (!selected(e)) return;
      registry_level_.insert(
          add_enumerator(e, required_attribute(e, "name"), parent, ""));
    });
  }

  void parse_commands(Element commands) {
    foreach_child(commands, "command", [&](Element e) {
      if (!selected(e)) return;
      auto command = std::make_unique<Command>();
      if (e->Attribute("alias")) {
        command->name = required_attribute(e, "name");
        command_aliases_.emplace_back(e, command.get());
      } else {
        Element proto = e->FirstChildElement("proto");
        if (!proto) fail(e, "command without <proto>");
        cdp::Declaration decl =
            cdp::parse_declaration(inner_text(proto), location(proto));
        command->name = decl.name;
        command->return_type = translate_type(proto, *decl.type);
        foreach_child(e, "param", [&](Element p) {
          if (!selected(p)) return;
          cdp::Declaration decl =
              cdp::parse_declaration(inner_text(p), location(p));
          Param param;
          param.name = decl.name;
          param.type = translate_type(p, *decl.type);
          param.len = attribute(p, "len");
          param.optional = vbg::startswith(attribute(p, "optional"), "true");
          command->params.push_back(std::move(param));
        });
        command->successcodes =
            vbg::split_nonempty(",", attribute(e, "successcodes"));
        command->errorcodes =
            vbg::split_nonempty(",", attribute(e, "errorcodes"));
      }
      declare(e, command.get());
      registry_.commands.push_back(std::move(command));
    });
  }

  void resolve_command_aliases() {
    for (auto [e, command] : command_aliases_) {
      std::string target = attribute(e, "alias");
      command->alias = dynamic_cast<const Command*>(registry_.find(target));
      if (!command->alias) fail(e, "alias of unknown command ", target);
    }
    for (auto [e, command] : command_aliases_) {
      std::vector<std::string> chain;
      for (const Command* c = command; c; c = c->alias) {
        bool seen =
            std::find(chain.begin(), chain.end(), c->name) != chain.end();
        chain.push_back(c->name);
        if (seen) fail(e, "command alias cycle ", vbg::join(" -> ", chain));
        if (chain.size() > kMaxAliasDepth) fail(e, "alias chain too deep");
      }
    }
  }

  // An alias chain that returns to one of its members never reaches a
  // definition.
  void check_type_alias_cycles() const {
    for (const auto& [e, type] : declared_types_) {
      if (type->kind() != TypeKind::ALIAS) continue;
      std::vector<std::string> chain;
      for (const TypeDef* t = type; t->kind() == TypeKind::ALIAS;
           t = static_cast<const Alias*>(t)->target) {
        size_t seen = std::find(chain.begin(), chain.end(), t->name) -
                      chain.begin();
        chain.push_back(t->name);
        if (seen + 1 != chain.size())
          throw vbg::cyclic_type_dependency(
              std::vector<std::string>(chain.begin() + seen, chain.end()));
        if (chain.size() > kMaxAliasDepth) fail(e, "alias chain too deep");
      }
    }
  }

  Group* add_group(Element e, GroupKind kind) {
    auto group = std::make_unique<Group>();
    Group* result = group.get();
    result->kind = kind;
    result->name = required_attribute(e, "name");
    result->index = registry_.groups.size();
    result->line = e->GetLineNum();
    result->number = attribute(e, "number");
    if (!registry_.group_map.emplace(result->name, result).second)
      fail(e, "duplicate definition of ", result->name);
    registry_.groups.push_back(std::move(group));
    return result;
  }

  void parse_feature(Element e) {
    if (!selected(e)) return;
    Group* group = add_group(e, GroupKind::FEATURE);
    group->supported = vbg::split_nonempty(",", attribute(e, "api"));
    if (group->supported.empty()) group->supported.push_back(options_.api);
    group->depends = attribute(e, "depends");
    DependsExpr::parse(group->depends, location(e));
    for (Element child = e->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
      std::string_view tag = child->Name();
      if (tag == "require")
        parse_require(group, child, "");
      else if (tag == "remove")
        apply_remove(child);
    }
  }

  void parse_extensions(Element extensions) {
    foreach_child(extensions, "extension", [&](Element e) {
      Group* group = add_group(e, GroupKind::EXTENSION);
      group->ext_type = attribute(e, "type");
      group->supported = vbg::split_nonempty(",", attribute(e, "supported"));
      group->promotedto = attribute(e, "promotedto");
      group->deprecatedby = attribute(e, "deprecatedby");

      group->author = attribute(e, "author");
      if (group->author.empty()) {
        std::vector<std::string> parts = vbg::split("_", group->name);
        if (parts.size() > 2) group->author = parts[1];
      }

      std::string platform = attribute(e, "platform");
      if (!platform.empty()) {
        group->platform = vbg::find_or_null(registry_.platform_map, platform);
        if (!group->platform) fail(e, "unknown platform ", platform);
      }

      if (e->Attribute("depends")) {
        group->depends = attribute(e, "depends");
      } else {
        std::vector<std::string> terms;
        std::string requires_list = attribute(e, "requires");
        if (!requires_list.empty())
          terms.push_back(requires_to_depends(requires_list));
        std::string core = attribute(e, "requiresCore");
        if (!core.empty()) {
          std::string version = core;
          std::replace(version.begin(), version.end(), '.', '_');
          terms.push_back("VK_VERSION_" + version);
        }
        group->depends = vbg::join("+", terms);
      }
      DependsExpr::parse(group->depends, location(e));

      if (!group->supports(options_.api)) {
        VLOG(1) << group->name << " does not support " << options_.api;
        return;
      }
      for (Element child = e->FirstChildElement(); child;
           child = child->NextSiblingElement()) {
        std::string_view tag = child->Name();
        if (tag == "require")
          parse_require(group, child, group->number);
        else if (tag == "remove")
          apply_remove(child);
      }
    });
  }

  void add_membership(Group* group, Entity* entity,
                      const std::string& depends) {
    if (auto type = dynamic_cast<const TypeDef*>(entity)) {
      if (std::find(group->types.begin(), group->types.end(), type) ==
          group->types.end())
        group->types.push_back(type);
    } else if (auto command = dynamic_cast<const Command*>(entity)) {
      if (std::find(group->commands.begin(), group->commands.end(),
                    command) == group->commands.end())
        group->commands.push_back(command);
    } else if (auto enumerator = dynamic_cast<const Enumerator*>(entity)) {
      if (std::find(group->enumerators.begin(), group->enumerators.end(),
                    enumerator) == group->enumerators.end())
        group->enumerators.push_back(enumerator);
    } else if (auto constant = dynamic_cast<const Constant*>(entity)) {
      if (std::find(group->constants.begin(), group->constants.end(),
                    constant) == group->constants.end())
        group->constants.push_back(constant);
    }

    // Values declared in an <enums> block exist wherever their enum does.
    if (vbg::contains(registry_level_, entity) && !entity->removed) return;
    for (const Membership& membership : entity->memberships)
      if (membership.group == group && membership.depends == depends) return;
    entity->memberships.push_back({group, depends});
  }

  Entity* lookup_required(Element e, const std::string& name) {
    Entity* entity = vbg::find_or_null(registry_.entities, name);
    if (!entity) fail(e, "unknown entity ", name);
    return entity;
  }

  void parse_require(Group* group, Element require,
                     const std::string& extnumber) {
    if (!selected(require)) return;

    std::vector<std::string> terms;
    std::string depends = attribute(require, "depends");
    if (!depends.empty()) terms.push_back(depends);
    std::string extension = attribute(require, "extension");
    if (!extension.empty()) terms.push_back(requires_to_depends(extension));
    std::string feature = attribute(require, "feature");
    if (!feature.empty()) terms.push_back(feature);
    if (terms.size() > 1)
      for (std::string& term : terms) term = "(" + term + ")";
    depends = vbg::join("+", terms);
    DependsExpr::parse(depends, location(require));

    for (Element e = require->FirstChildElement(); e;
         e = e->NextSiblingElement()) {
      std::string_view tag = e->Name();
      if (tag == "comment" || tag == "feature") continue;
      if (!selected(e)) continue;
      std::string name = required_attribute(e, "name");
      if (tag == "type") {
        if (vbg::contains(ignored_types_, name)) continue;
        Entity* entity = vbg::find_or_null(registry_.entities, name);
        if (!dynamic_cast<TypeDef*>(entity)) fail(e, "unknown type ", name);
        add_membership(group, entity, depends);
      } else if (tag == "command") {
        Entity* entity = vbg::find_or_null(registry_.entities, name);
        if (!dynamic_cast<Command*>(entity)) fail(e, "unknown command ", name);
        add_membership(group, entity, depends);
      } else if (tag == "enum") {
        add_membership(group, require_enum(e, name, extnumber), depends);
      } else {
        fail(e, "unexpected <", tag, "> in <require>");
      }
    }
  }

  Entity* require_enum(Element e, const std::string& name,
                       const std::string& extnumber) {
    bool defines_value = e->Attribute("value") || e->Attribute("bitpos") ||
                         e->Attribute("offset") || e->Attribute("alias");
    if (!defines_value) return lookup_required(e, name);

    std::string extends = attribute(e, "extends");
    if (extends.empty()) {
      Entity* existing = vbg::find_or_null(registry_.entities, name);
      if (!existing) return add_constant(e, name);
      auto constant = dynamic_cast<Constant*>(existing);
      if (!constant) fail(e, "duplicate definition of ", name);
      if (!constant->alias && attribute(e, "value") != constant->value &&
          !e->Attribute("alias"))
        fail(e, "mismatched value of ", name);
      return constant;
    }

    Enum* parent = nullptr;
    if (auto extended = dynamic_cast<const TypeDef*>(registry_.find(extends)))
      parent = dynamic_cast<Enum*>(
          vbg::find_or_null(registry_.entities, extended->canonical()->name));
    if (!parent) fail(e, "unknown extends target ", extends);

    Entity* existing = vbg::find_or_null(registry_.entities, name);
    if (!existing)
      return add_enumerator(e, name, parent, extnumber);

    auto enumerator = dynamic_cast<Enumerator*>(existing);
    if (!enumerator || enumerator->parent != parent)
      fail(e, "duplicate definition of ", name);
    std::optional<int64_t> value = enum_value(e, extnumber);
    auto pending = std::find_if(
        enumerator_aliases_.begin(), enumerator_aliases_.end(),
        [enumerator](const auto& entry) { return entry.second == enumerator; });
    bool existing_is_alias = pending != enumerator_aliases_.end();
    if (value.has_value() == existing_is_alias)
      fail(e, "mismatched value of ", name);
    if (value && *value != enumerator->value)
      fail(e, "mismatched value of ", name, ": ", *value, " vs ",
           enumerator->value);
    if (!value && attribute(e, "alias") != attribute(pending->first, "alias"))
      fail(e, "mismatched alias of ", name);
    return enumerator;
  }

  // Strips the memberships the named entities gained in earlier groups.
  void apply_remove(Element remove) {
    if (!selected(remove)) return;
    for (Element e = remove->FirstChildElement(); e;
         e = e->NextSiblingElement()) {
      std::string_view tag = e->Name();
      if (tag == "comment" || tag == "feature") continue;
      std::string name = required_attribute(e, "name");
      if (tag == "type" && vbg::contains(ignored_types_, name)) continue;
      Entity* entity = lookup_required(e, name);
      VLOG(1) << "removing " << name;
      entity->memberships.clear();
      entity->removed = true;
    }
  }

  void resolve_enumerator_aliases() {
    for (auto [e, enumerator] : enumerator_aliases_) {
      std::string target = attribute(e, "alias");
      enumerator->alias =
          dynamic_cast<const Enumerator*>(registry_.find(target));
      if (!enumerator->alias)
        fail(e, "enum alias to unknown enumerator ", target);
    }
    for (auto [e, enumerator] : enumerator_aliases_) {
      const Enumerator* target = enumerator->alias;
      size_t depth = 0;
      while (target->alias) {
        if (++depth == kMaxAliasDepth) fail(e, "alias chain too deep");
        target = target->alias;
      }
      enumerator->value = target->value;
    }
  }

  void resolve_constant_aliases() {
    for (auto [e, constant] : constant_aliases_) {
      std::string target = attribute(e, "alias");
      constant->alias = dynamic_cast<const Constant*>(registry_.find(target));
      if (!constant->alias) fail(e, "alias of unknown constant ", target);
    }
    for (auto [e, constant] : constant_aliases_) {
      const Constant* target = constant->alias;
      size_t depth = 0;
      while (target->alias) {
        if (++depth == kMaxAliasDepth) fail(e, "alias chain too deep");
        target = target->alias;
      }
      constant->value = target->value;
      constant->c_type = target->c_type;
    }
  }

  void assign_dispatch_levels() {
    for (auto& command : registry_.commands) {
      if (command->alias) continue;
      command->level = dispatch_level(*command);
    }
    for (auto& command : registry_.commands)
      if (command->alias) command->level = command->definition().level;
  }

  static DispatchLevel dispatch_level(const Command& command) {
    if (command.name == "vkGetInstanceProcAddr" ||
        command.name == "vkGetDeviceProcAddr")
      return DispatchLevel::INSTANCE;
    if (command.params.empty()) return DispatchLevel::GLOBAL;
    auto name = dynamic_cast<const Name*>(command.params[0].type.get());
    if (!name) return DispatchLevel::GLOBAL;
    auto handle = dynamic_cast<const Handle*>(
        static_cast<const TypeDef*>(name->entity)->canonical());
    if (!handle) return DispatchLevel::GLOBAL;
    if (handle->descends_from("VkDevice")) return DispatchLevel::DEVICE;
    if (handle->descends_from("VkInstance")) return DispatchLevel::INSTANCE;
    return DispatchLevel::GLOBAL;
  }

  void check_header_version() const {
    if (!options_.expected_header_version) return;
    if (registry_.header_version != options_.expected_header_version)
      throw vbg::malformed_registry(
          vbg::concat("VK_HEADER_VERSION is ",
                      registry_.header_version
                          ? std::to_string(*registry_.header_version)
                          : std::string("missing"),
                      ", expected ", *options_.expected_header_version),
          source_);
  }

  Registry registry_;
  std::string source_;
  ParseOptions options_;
  size_t next_index_ = 0;

  std::vector<std::pair<Element, TypeDef*>> declared_types_;
  std::unordered_set<std::string> ignored_types_;
  std::unordered_set<const Entity*> registry_level_;
  std::vector<std::pair<Element, Enumerator*>> enumerator_aliases_;
  std::vector<std::pair<Element, Constant*>> constant_aliases_;
  std::vector<std::pair<Element, Command*>> command_aliases_;
};

}  // namespace

std::optional<int64_t> parse_c_integer(const std::string& text) {
  std::string s = vbg::trim(text);
  while (s.size() >= 2 && s.front() == '(' && s.back() == ')')
    s = vbg::trim(s.substr(1, s.size() - 2));

  bool complement = false;
  bool negative = false;
  if (!s.empty() && s[0] == '~') {
    complement = true;
    s = vbg::trim(s.substr(1));
  } else if (!s.empty() && s[0] == '-') {
    negative = true;
    s = vbg::trim(s.substr(1));
  }

  bool is_unsigned = false;
  int longs = 0;
  while (!s.empty()) {
    char c = std::tolower((unsigned char)s.back());
    if (c == 'u')
      is_unsigned = true;
    else if (c == 'l')
      longs++;
    else
      break;
    s.pop_back();
  }
  if (s.empty()) return std::nullopt;

  uint64_t base = 10;
  size_t start = 0;
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    start = 2;
  }
  uint64_t value = 0;
  for (size_t i = start; i < s.size(); i++) {
    char c = std::tolower((unsigned char)s[i]);
    uint64_t digit;
    if (c >= '0' && c <= '9')
      digit = c - '0';
    else if (base == 16 && c >= 'a' && c <= 'f')
      digit = c - 'a' + 10;
    else
      return std::nullopt;
    if (value > (std::numeric_limits<uint64_t>::max() - digit) / base)
      return std::nullopt;
    value = value * base + digit;
  }

  if (complement) {
    value = ~value;
    if (is_unsigned && longs == 0) value &= 0xFFFFFFFFu;
    return static_cast<int64_t>(value);
  }
  constexpr uint64_t kMinMagnitude = uint64_t{1} << 63;
  if (negative) {
    if (value > kMinMagnitude) return std::nullopt;
    if (value == kMinMagnitude) return std::numeric_limits<int64_t>::min();
    return -static_cast<int64_t>(value);
  }
  return static_cast<int64_t>(value);
}

Registry parse_registry_string(const std::string& xml,
                               const std::string& source,
                               const ParseOptions& options) {
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS)
    throw vbg::malformed_registry(doc.ErrorStr(),
                                  vbg::concat(source, ":", doc.ErrorLineNum()));
  return RegistryParser(source, options).parse(doc);
}

Registry parse_registry_file(const std::filesystem::path& path,
                             const ParseOptions& options) {
  std::string xml;
  try {
    xml = vbg::load_file(path);
  } catch (const std::ios_base::failure& e) {
    throw vbg::malformed_registry(
        vbg::concat("cannot read registry: ", e.what()), path.string());
  }
  return parse_registry_string(xml, path.string(), options);
}

}  // namespace vkr
