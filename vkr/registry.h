#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// In-memory model of the Vulkan API registry (vk.xml).
namespace vkr {

struct Entity;
struct Group;

enum class EntityKind { TYPE, ENUMERATOR, CONSTANT, COMMAND };

// Records that a <require> block of `group` introduced an entity. The block
// may carry its own `depends` condition.
struct Membership {
  const Group* group = nullptr;
  std::string depends;
};

struct Entity {
  std::string name;
  size_t index = 0;  // document order
  int line = 0;
  std::vector<Membership> memberships;
  // Named by a <remove> block of a selected feature.
  bool removed = false;

  virtual ~Entity() = default;
  virtual EntityKind entity_kind() const = 0;

  // Entities no feature or extension requires, such as API constants and
  // vk_platform scalars, exist whenever something references them.
  bool unconditional() const { return memberships.empty() && !removed; }
  bool member_of(const Group* group) const;
};

// How a type expression reaches the entity it names.
enum class RefMode {
  VALUE,
  POINTER,
  SIGNATURE,  // parameter or return of a function pointer type
};

struct TypeRef {
  const Entity* entity;
  RefMode mode;
};

struct Expr {
  virtual std::string to_string() const = 0;
  virtual void collect_refs(std::vector<TypeRef>& refs) const = 0;
  virtual ~Expr() = default;
};

struct Number : Expr {
  std::string number;
  std::string to_string() const override { return number; }
  void collect_refs(std::vector<TypeRef>&) const override {}
};

struct Reference : Expr {
  const Entity* entity = nullptr;
  std::string to_string() const override { return entity->name; }
  void collect_refs(std::vector<TypeRef>& refs) const override {
    refs.push_back({entity, RefMode::VALUE});
  }
};

// A type expression as written in a member, parameter or typedef.
struct Type {
  virtual ~Type() = default;
  virtual std::string to_string() const = 0;
  virtual std::string declare(const std::string& id) const {
    return to_string() + " " + id;
  }
  virtual void collect_refs(std::vector<TypeRef>& refs, RefMode mode) const = 0;
  virtual bool is_pointer() const { return false; }
};

struct Name : Type {
  const Entity* entity = nullptr;
  std::string to_string() const override { return entity->name; }
  void collect_refs(std::vector<TypeRef>& refs, RefMode mode) const override {
    refs.push_back({entity, mode});
  }
};

// "struct tag" naming a struct the registry does not define.
struct Elaborated : Type {
  std::string tag;
  std::string to_string() const override { return "struct " + tag; }
  void collect_refs(std::vector<TypeRef>&, RefMode) const override {}
};

struct Const : Type {
  std::unique_ptr<Type> T;
  std::string to_string() const override;
  void collect_refs(std::vector<TypeRef>& refs, RefMode mode) const override {
    T->collect_refs(refs, mode);
  }
  bool is_pointer() const override { return T->is_pointer(); }
};

struct Pointer : Type {
  std::unique_ptr<Type> T;
  std::string to_string() const override { return T->to_string() + "*"; }
  void collect_refs(std::vector<TypeRef>& refs, RefMode mode) const override {
    T->collect_refs(refs, mode == RefMode::VALUE ? RefMode::POINTER : mode);
  }
  bool is_pointer() const override { return true; }
};

struct Array : Type {
  std::unique_ptr<Type> T;
  std::unique_ptr<Expr> N;
  std::string to_string() const override { return declare(""); }
  std::string declare(const std::string& id) const override {
    return T->declare(id + "[" + N->to_string() + "]");
  }
  void collect_refs(std::vector<TypeRef>& refs, RefMode mode) const override {
    T->collect_refs(refs, mode);
    N->collect_refs(refs);
  }
};

enum class TypeKind {
  PRIMITIVE,
  EXTERNAL,
  BASETYPE,
  BITMASK,
  ENUM,
  HANDLE,
  STRUCT,
  UNION,
  FUNCPOINTER,
  ALIAS,
};

std::string_view to_string(TypeKind kind);

struct TypeDef : Entity {
  EntityKind entity_kind() const override { return EntityKind::TYPE; }
  virtual TypeKind kind() const = 0;
  // Everything that must exist for this type's declaration to compile.
  virtual void collect_refs(std::vector<TypeRef>&) const {}
  // Follows aliases to the defining TypeDef.
  const TypeDef* canonical() const;
};

// A C scalar provided by vk_platform.h or the C library.
struct Primitive : TypeDef {
  TypeKind kind() const override { return TypeKind::PRIMITIVE; }
};

// A type supplied by a platform header, e.g. Display from X11/Xlib.h.
struct External : TypeDef {
  std::string header;
  TypeKind kind() const override { return TypeKind::EXTERNAL; }
};

struct BaseType : TypeDef {
  // Exactly one of these describes the definition.
  std::unique_ptr<Type> underlying;  // typedef <underlying> name;
  bool opaque = false;               // struct name;
  std::string verbatim;              // preprocessor text kept as written

  TypeKind kind() const override { return TypeKind::BASETYPE; }
  void collect_refs(std::vector<TypeRef>& refs) const override;
};

struct Enumerator;

struct Enum : TypeDef {
  bool is_bitmask = false;
  int bitwidth = 32;
  std::vector<const Enumerator*> enumerators;

  TypeKind kind() const override { return TypeKind::ENUM; }
  // The fixed underlying type of a 32-bit enum. Vulkan enums are C enums
  // sized as int; one whose values exceed INT32_MAX is unsigned.
  std::string underlying_type() const;
};

struct Bitmask : TypeDef {
  const TypeDef* flags = nullptr;  // VkFlags or VkFlags64
  std::string bitvalues;           // name of the FlagBits enum, if any

  TypeKind kind() const override { return TypeKind::BITMASK; }
  void collect_refs(std::vector<TypeRef>& refs) const override {
    refs.push_back({flags, RefMode::VALUE});
  }
};

struct Handle : TypeDef {
  bool dispatchable = false;
  std::vector<const Handle*> parents;
  std::string objtypeenum;

  TypeKind kind() const override { return TypeKind::HANDLE; }
  // True if this handle is, or descends from, `ancestor`.
  bool descends_from(const std::string& ancestor) const;
};

struct Member {
  std::string name;
  std::unique_ptr<Type> type;
  std::optional<int> bitfield_width;
  std::string values;  // fixed sType value
  std::string len;
  bool optional = false;
};

struct Struct : TypeDef {
  bool is_union = false;
  bool returnedonly = false;
  std::vector<Member> members;
  std::vector<std::string> structextends;

  TypeKind kind() const override {
    return is_union ? TypeKind::UNION : TypeKind::STRUCT;
  }
  void collect_refs(std::vector<TypeRef>& refs) const override;
};

struct Param {
  std::string name;
  std::unique_ptr<Type> type;
  std::string len;
  bool optional = false;
};

std::string signature_string(const Type& return_type,
                             const std::vector<Param>& params,
                             const std::string& calling_convention);

struct FuncPointer : TypeDef {
  std::unique_ptr<Type> return_type;
  std::vector<Param> params;

  TypeKind kind() const override { return TypeKind::FUNCPOINTER; }
  void collect_refs(std::vector<TypeRef>& refs) const override;
};

struct Alias : TypeDef {
  const TypeDef* target = nullptr;
  std::string category;

  TypeKind kind() const override { return TypeKind::ALIAS; }
  void collect_refs(std::vector<TypeRef>& refs) const override {
    refs.push_back({target, RefMode::VALUE});
  }
};

struct Enumerator : Entity {
  const Enum* parent = nullptr;
  int64_t value = 0;
  const Enumerator* alias = nullptr;

  EntityKind entity_kind() const override { return EntityKind::ENUMERATOR; }
};

struct Constant : Entity {
  std::string value;   // C++ literal, e.g. 256U or "VK_KHR_surface"
  std::string c_type;  // uint32_t, uint64_t, float, const char*, ...
  const Constant* alias = nullptr;

  EntityKind entity_kind() const override { return EntityKind::CONSTANT; }
};

enum class DispatchLevel { GLOBAL, INSTANCE, DEVICE };

std::string_view to_string(DispatchLevel level);

struct Command : Entity {
  std::unique_ptr<Type> return_type;
  std::vector<Param> params;
  const Command* alias = nullptr;
  DispatchLevel level = DispatchLevel::GLOBAL;
  std::vector<std::string> successcodes;
  std::vector<std::string> errorcodes;

  EntityKind entity_kind() const override { return EntityKind::COMMAND; }

  // Aliases share the signature of the command they alias.
  const Command& definition() const {
    return alias ? alias->definition() : *this;
  }
  void collect_refs(std::vector<TypeRef>& refs) const;
};

struct Platform {
  std::string name;
  std::string protect;
};

struct Tag {
  std::string name;
  std::string author;
};

enum class GroupKind { FEATURE, EXTENSION };

// A core API version (<feature>) or an <extension>.
struct Group {
  std::string name;
  GroupKind kind = GroupKind::FEATURE;
  size_t index = 0;
  int line = 0;
  std::string number;    // "1.0" for features, extension number otherwise
  std::string ext_type;  // "instance" or "device"
  const Platform* platform = nullptr;
  std::string author;
  std::vector<std::string> supported;
  std::string depends;
  std::string promotedto;
  std::string deprecatedby;

  std::vector<const TypeDef*> types;
  std::vector<const Enumerator*> enumerators;
  std::vector<const Constant*> constants;
  std::vector<const Command*> commands;

  bool supports(const std::string& api) const;
};

class Registry {
 public:
  Registry() = default;
  Registry(Registry&&) = default;
  Registry& operator=(Registry&&) = default;
  Registry(const Registry&) = delete;
  Registry& operator=(const Registry&) = delete;

  std::string api;
  std::string source;
  std::optional<uint32_t> header_version;

  std::vector<std::unique_ptr<Platform>> platforms;
  std::vector<std::unique_ptr<Tag>> tags;
  std::vector<std::unique_ptr<TypeDef>> types;
  std::vector<std::unique_ptr<Enumerator>> enumerators;
  std::vector<std::unique_ptr<Constant>> constants;
  std::vector<std::unique_ptr<Command>> commands;
  std::vector<std::unique_ptr<Group>> groups;

  std::unordered_map<std::string, Entity*> entities;
  std::unordered_map<std::string, Group*> group_map;
  std::unordered_map<std::string, Platform*> platform_map;

  const Entity* find(const std::string& name) const;
  const Group* find_group(const std::string& name) const;

  template <class T>
  const T* find_as(const std::string& name) const {
    return dynamic_cast<const T*>(find(name));
  }
};

}  // namespace vkr
