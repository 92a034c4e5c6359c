#include "cdp/cdecl_parser.h"

#include "gtest/gtest.h"
#include "vbg/error.h"

namespace {

template <typename T>
const T& as(const std::unique_ptr<cdp::Type>& type) {
  auto result = dynamic_cast<const T*>(type.get());
  EXPECT_NE(result, nullptr);
  return *result;
}

TEST(CDeclParserTest, SimpleMember) {
  cdp::Declaration decl = cdp::parse_declaration("uint32_t width", "test");
  EXPECT_EQ(decl.name, "width");
  EXPECT_EQ(as<cdp::Name>(decl.type).name, "uint32_t");
  EXPECT_FALSE(decl.bitfield_width);
}

TEST(CDeclParserTest, PointerToConstPointer) {
  cdp::Declaration decl = cdp::parse_declaration(
      "const char* const* ppEnabledExtensionNames", "test");
  EXPECT_EQ(decl.name, "ppEnabledExtensionNames");
  const auto& outer = as<cdp::Pointer>(decl.type);
  const auto& c = as<cdp::Const>(outer.T);
  const auto& inner = as<cdp::Pointer>(c.T);
  const auto& c2 = as<cdp::Const>(inner.T);
  EXPECT_EQ(as<cdp::Name>(c2.T).name, "char");
}

TEST(CDeclParserTest, ElaboratedStruct) {
  cdp::Declaration decl =
      cdp::parse_declaration("struct wl_display* display", "test");
  const auto& name = as<cdp::Name>(as<cdp::Pointer>(decl.type).T);
  EXPECT_EQ(name.name, "wl_display");
  EXPECT_TRUE(name.elaborated);
}

TEST(CDeclParserTest, NestedArrays) {
  cdp::Declaration decl = cdp::parse_declaration("float matrix[3][4]", "test");
  const auto& outer = as<cdp::Array>(decl.type);
  auto outer_n = dynamic_cast<const cdp::Number*>(outer.N.get());
  ASSERT_NE(outer_n, nullptr);
  EXPECT_EQ(outer_n->number, "3");
  const auto& inner = as<cdp::Array>(outer.T);
  auto inner_n = dynamic_cast<const cdp::Number*>(inner.N.get());
  ASSERT_NE(inner_n, nullptr);
  EXPECT_EQ(inner_n->number, "4");
  EXPECT_EQ(as<cdp::Name>(inner.T).name, "float");
}

TEST(CDeclParserTest, ConstantExtent) {
  cdp::Declaration decl = cdp::parse_declaration(
      "char deviceName[VK_MAX_PHYSICAL_DEVICE_NAME_SIZE]", "test");
  auto n = dynamic_cast<const cdp::Reference*>(as<cdp::Array>(decl.type).N.get());
  ASSERT_NE(n, nullptr);
  EXPECT_EQ(n->name, "VK_MAX_PHYSICAL_DEVICE_NAME_SIZE");
}

TEST(CDeclParserTest, BitField) {
  cdp::Declaration decl =
      cdp::parse_declaration("uint32_t instanceCustomIndex:24", "test");
  EXPECT_EQ(decl.name, "instanceCustomIndex");
  ASSERT_TRUE(decl.bitfield_width);
  EXPECT_EQ(*decl.bitfield_width, 24);
}

TEST(CDeclParserTest, Typedef) {
  cdp::Declaration decl = cdp::parse_typedef("typedef uint64_t VkDeviceSize;",
                                             "test");
  EXPECT_EQ(decl.name, "VkDeviceSize");
  EXPECT_EQ(as<cdp::Name>(decl.type).name, "uint64_t");
}

TEST(CDeclParserTest, FunctionPrototype) {
  cdp::FunctionPrototype proto = cdp::parse_function_prototype(
      "typedef void* (VKAPI_PTR *PFN_vkAllocationFunction)(void* pUserData, "
      "size_t size, size_t alignment, VkSystemAllocationScope "
      "allocationScope);",
      "test");
  EXPECT_EQ(proto.name, "PFN_vkAllocationFunction");
  EXPECT_EQ(as<cdp::Name>(as<cdp::Pointer>(proto.return_type).T).name,
            "void");
  ASSERT_EQ(proto.params.size(), 4u);
  EXPECT_EQ(proto.params[3].name, "allocationScope");
}

TEST(CDeclParserTest, VoidParameterList) {
  cdp::FunctionPrototype proto = cdp::parse_function_prototype(
      "typedef void (VKAPI_PTR *PFN_vkVoidFunction)(void);", "test");
  EXPECT_EQ(proto.name, "PFN_vkVoidFunction");
  EXPECT_TRUE(proto.params.empty());
}

TEST(CDeclParserTest, OpaqueStruct) {
  EXPECT_EQ(cdp::parse_opaque_struct("struct ANativeWindow;"), "ANativeWindow");
  EXPECT_EQ(cdp::parse_opaque_struct("struct  ANativeWindow ;"),
            "ANativeWindow");
  EXPECT_EQ(cdp::parse_opaque_struct("typedef int X;"), std::nullopt);
}

TEST(CDeclParserTest, Errors) {
  EXPECT_THROW(cdp::parse_declaration("uint32_t", "test"),
               vbg::malformed_registry);
  EXPECT_THROW(cdp::parse_declaration("uint32_t x y", "test"),
               vbg::malformed_registry);
  EXPECT_THROW(cdp::parse_declaration("float m[", "test"),
               vbg::malformed_registry);
  EXPECT_THROW(cdp::parse_typedef("typedef uint32_t x", "test"),
               vbg::malformed_registry);
  EXPECT_THROW(cdp::parse_declaration("uint32_t x @", "test"),
               vbg::malformed_registry);
  try {
    cdp::parse_declaration("const const int x", "vk.xml:12");
    FAIL();
  } catch (const vbg::malformed_registry& e) {
    EXPECT_EQ(e.location(), "vk.xml:12");
  }
}

}  // namespace
