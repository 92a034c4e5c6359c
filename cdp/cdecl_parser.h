#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

// Parser for the C declaration fragments embedded in the registry: struct
// members, command prototypes and parameters, base type typedefs and
// function pointer typedefs.
namespace cdp {

struct Expr {
  virtual ~Expr() = default;
};

struct Reference : Expr {
  Reference(const std::string& name) : name(name) {}
  std::string name;
};

struct Number : Expr {
  Number(const std::string& number) : number(number) {}
  std::string number;
};

struct Type {
  virtual ~Type() = default;
};

struct Name : Type {
  Name(const std::string& name, bool elaborated)
      : name(name), elaborated(elaborated) {}
  std::string name;
  // Written as "struct name".
  bool elaborated;
};

struct Const : Type {
  Const(std::unique_ptr<Type> T) : T(std::move(T)) {}
  std::unique_ptr<Type> T;
};

struct Pointer : Type {
  Pointer(std::unique_ptr<Type> T) : T(std::move(T)) {}
  std::unique_ptr<Type> T;
};

// Multi-dimensional arrays nest: float m[3][4] is Array(Array(float, 4), 3).
struct Array : Type {
  Array(std::unique_ptr<Type> T, std::unique_ptr<Expr> N)
      : T(std::move(T)), N(std::move(N)) {}
  std::unique_ptr<Type> T;
  std::unique_ptr<Expr> N;
};

struct Declaration {
  std::string name;
  std::unique_ptr<Type> type;
  std::optional<int> bitfield_width;
};

struct FunctionPrototype {
  std::string name;
  std::unique_ptr<Type> return_type;
  std::vector<Declaration> params;
};

// "const VkFoo* pFoo", "char name[VK_MAX]", "uint32_t mask:8"
Declaration parse_declaration(const std::string& code,
                              const std::string& location);

// "typedef uint32_t VkBool32;"
Declaration parse_typedef(const std::string& code, const std::string& location);

// "typedef void (VKAPI_PTR *PFN_vkVoidFunction)(void);"
FunctionPrototype parse_function_prototype(const std::string& code,
                                           const std::string& location);

// "struct ANativeWindow;" yields "ANativeWindow", anything else nullopt.
std::optional<std::string> parse_opaque_struct(const std::string& code);

}  // namespace cdp
