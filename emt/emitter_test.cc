#include "emt/emitter.h"

#include <algorithm>
#include <regex>

#include "dep/resolver.h"
#include "gtest/gtest.h"
#include "vkr/registry_parser.h"

namespace {

const char* kScenario = R"(<registry>
  <platforms>
    <platform name="plat" protect="VK_USE_PLATFORM_PLAT"/>
  </platforms>
  <types>
    <type requires="vk_platform" name="uint32_t"/>
    <type category="struct" name="B">
      <member><type>A</type> <name>a</name></member>
    </type>
    <type category="struct" name="A">
      <member><type>uint32_t</type> <name>x</name></member>
    </type>
  </types>
  <commands>
    <command>
      <proto><type>A</type> <name>C</name></proto>
      <param><type>B</type> <name>b</name></param>
    </command>
    <command>
      <proto><type>uint32_t</type> <name>E</name></proto>
      <param>const <type>A</type>* <name>a</name></param>
    </command>
  </commands>
  <feature api="vulkan" name="core-1.0" number="1.0">
    <require><type name="A"/><type name="B"/><command name="C"/></require>
  </feature>
  <extensions>
    <extension name="ext-X" number="1" type="instance" platform="plat" author="KHR" supported="vulkan">
      <require><type name="A"/><command name="E"/></require>
    </extension>
  </extensions>
</registry>)";

std::string emit(vkr::Registry registry, const flt::Config& config,
                 const emt::EmitOptions& options = {}) {
  dep::DependencyGraph graph = dep::resolve(registry);
  flt::Selection selection = flt::select(registry, graph, config);
  return emt::emit_header(registry, selection, options);
}

std::string scenario(const flt::Config& config) {
  return emit(vkr::parse_registry_string(kScenario, "scenario.xml", {}),
              config);
}

std::string mini(const flt::Config& config) {
  return emit(vkr::parse_registry_file("testdata/mini_vk.xml", {}), config);
}

bool contains(const std::string& text, const std::string& part) {
  return text.find(part) != std::string::npos;
}

// Position of `part`, failing the test when absent.
size_t at(const std::string& text, const std::string& part) {
  size_t pos = text.find(part);
  EXPECT_NE(pos, std::string::npos) << part;
  return pos;
}

// The V(...) lines of one visit_commands overload.
std::vector<std::string> visited(const std::string& text,
                                 const std::string& table) {
  std::vector<std::string> names;
  size_t start = at(text, "void visit_commands(" + table + "& t,");
  size_t end = text.find("\n}\n", start);
  std::string body = text.substr(start, end - start);
  std::regex line("V\\(t\\.(\\w+), \"(\\w+)\"\\);");
  for (auto it = std::sregex_iterator(body.begin(), body.end(), line);
       it != std::sregex_iterator(); ++it) {
    EXPECT_EQ((*it)[1], (*it)[2]);
    names.push_back((*it)[2]);
  }
  return names;
}

TEST(EmitterTest, ScenarioCore) {
  std::string header = scenario({});
  EXPECT_LT(at(header, "struct A {"), at(header, "struct B {"));
  EXPECT_TRUE(contains(header, "struct B {\n  A a;\n};"));
  EXPECT_TRUE(contains(header, "using PFN_C = A (VKBINDGEN_PTR *)(B);"));
  EXPECT_TRUE(contains(header, "struct core_1_0_commands {\n"
                               "  PFN_C C = nullptr;\n"
                               "};"));
  EXPECT_EQ(visited(header, "core_1_0_commands"),
            std::vector<std::string>{"C"});
}

TEST(EmitterTest, ScenarioExcludedPlatform) {
  std::string header = scenario({});
  EXPECT_TRUE(contains(header, "struct A {"));
  EXPECT_FALSE(contains(header, "ext_X_commands"));
  EXPECT_FALSE(contains(header, "PFN_E"));
  EXPECT_FALSE(contains(header, "VK_USE_PLATFORM_PLAT"));
}

TEST(EmitterTest, ScenarioIncludedPlatform) {
  flt::Config config;
  config.platforms = {"plat"};
  std::string header = scenario(config);
  EXPECT_TRUE(contains(header,
                       "#if defined(VK_USE_PLATFORM_PLAT)\n"
                       "using PFN_E = uint32_t (VKBINDGEN_PTR *)(const A*);\n"
                       "#endif\n"));
  EXPECT_TRUE(contains(header,
                       "#if defined(VK_USE_PLATFORM_PLAT)\n"
                       "struct ext_X_commands {\n"
                       "  PFN_E E = nullptr;\n"
                       "};\n"));
  // A is needed by the core as well, so it is not gated.
  EXPECT_TRUE(contains(header, "\nstruct A {\n"));
  EXPECT_FALSE(contains(header, "#if defined(VK_USE_PLATFORM_PLAT)\nstruct A {"));
}

TEST(EmitterTest, Deterministic) {
  flt::Config config;
  config.platforms = {"xlib", "win32"};
  EXPECT_EQ(mini(config), mini(config));
  EXPECT_EQ(mini({}), mini({}));
}

TEST(EmitterTest, Preamble) {
  std::string header = mini({});
  EXPECT_EQ(header.rfind("// Generated by vkbindgen from mini_vk.xml.", 0), 0u);
  EXPECT_TRUE(contains(header, "#ifndef VKBINDGEN_VKB_H_\n#define VKBINDGEN_VKB_H_\n"));
  EXPECT_TRUE(contains(header, "#include <cstdint>\n"));
  EXPECT_TRUE(contains(header, "#define VKBINDGEN_CALL __stdcall\n"));
  EXPECT_TRUE(contains(header, "namespace vkb {\n"));
  EXPECT_TRUE(contains(header, "}  // namespace vkb\n\n#endif  // VKBINDGEN_VKB_H_\n"));
  EXPECT_TRUE(contains(header, "constexpr uint32_t header_version = 250;"));
  EXPECT_TRUE(contains(header, "constexpr uint32_t make_api_version("));
  EXPECT_FALSE(contains(header, "X11/Xlib.h"));
}

TEST(EmitterTest, Namespace) {
  emt::EmitOptions options;
  options.ns = "gfx::vk";
  options.source_name = "vk.xml";
  std::string header =
      emit(vkr::parse_registry_file("testdata/mini_vk.xml", {}), {}, options);
  EXPECT_TRUE(contains(header, "// Generated by vkbindgen from vk.xml."));
  EXPECT_TRUE(contains(header, "#ifndef VKBINDGEN_GFX__VK_H_\n"));
  EXPECT_TRUE(contains(header, "namespace gfx::vk {\n"));
}

TEST(EmitterTest, Constants) {
  std::string header = mini({});
  EXPECT_TRUE(contains(header,
                       "constexpr uint32_t VK_MAX_PHYSICAL_DEVICE_NAME_SIZE = 256;"));
  EXPECT_TRUE(contains(header, "constexpr float VK_LOD_CLAMP_NONE = 1000.0F;"));
  EXPECT_TRUE(contains(header, "constexpr uint32_t VK_REMAINING_MIP_LEVELS = (~0U);"));
  EXPECT_TRUE(contains(header, "constexpr uint64_t VK_WHOLE_SIZE = (~0ULL);"));
  EXPECT_TRUE(contains(header,
                       "constexpr const char* VK_KHR_SURFACE_EXTENSION_NAME = "
                       "\"VK_KHR_surface\";"));
  EXPECT_FALSE(contains(header, "VK_LUID_SIZE_KHR"));
  // Constants come before the types that use them.
  EXPECT_LT(at(header, "VK_UUID_SIZE = 16;"),
            at(header, "struct VkPhysicalDeviceProperties {"));
}

TEST(EmitterTest, Types) {
  std::string header = mini({});
  EXPECT_TRUE(contains(header, "using VkBool32 = uint32_t;"));
  EXPECT_TRUE(contains(header, "using VkQueueFlags = VkFlags;"));
  EXPECT_TRUE(contains(header, "using VkAccessFlags2 = VkFlags64;"));
  EXPECT_TRUE(contains(header, "using VkAccessFlags2KHR = VkAccessFlags2;"));
  EXPECT_TRUE(contains(header, "VKBINDGEN_DEFINE_HANDLE(VkInstance)"));
  EXPECT_TRUE(contains(header, "VKBINDGEN_DEFINE_NON_DISPATCHABLE_HANDLE(VkFence)"));
  EXPECT_TRUE(contains(header, "struct VkPhysicalDeviceProperties2;\n"));
  EXPECT_TRUE(contains(header, "union VkClearColorValue;\n"));
  EXPECT_TRUE(contains(header, "union VkClearColorValue {\n  float float32[4];\n"));
  EXPECT_TRUE(contains(header, "  char deviceName[VK_MAX_PHYSICAL_DEVICE_NAME_SIZE];\n"));
  EXPECT_TRUE(contains(header, "  float matrix[3][4];\n"));
  EXPECT_TRUE(contains(header, "  uint32_t instanceCustomIndex : 24;\n"));
  EXPECT_TRUE(contains(header, "  const char* const* ppEnabledExtensionNames;\n"));
  EXPECT_TRUE(contains(header,
                       "using PFN_vkAllocationFunction = void* (VKBINDGEN_PTR *)"
                       "(void*, size_t, size_t, VkSystemAllocationScope);"));
  EXPECT_TRUE(contains(header,
                       "using VkPhysicalDeviceProperties2KHR = "
                       "VkPhysicalDeviceProperties2;"));
}

TEST(EmitterTest, Enums) {
  std::string header = mini({});
  EXPECT_TRUE(contains(header, "enum VkResult : int32_t {\n  VK_SUCCESS = 0,\n"));
  EXPECT_TRUE(contains(header, "  VK_ERROR_SURFACE_LOST_KHR = -1000000000,\n"));
  EXPECT_TRUE(contains(header,
                       "  VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_PROPERTIES_2_KHR = "
                       "1000059001,\n"));
  EXPECT_TRUE(contains(header, "  VK_QUEUE_TRANSFER_BIT = 4,\n"));
  EXPECT_TRUE(contains(header, "using VkAccessFlagBits2 = uint64_t;\n"));
  EXPECT_TRUE(contains(header,
                       "constexpr VkAccessFlagBits2 "
                       "VK_ACCESS_2_SHADER_STORAGE_READ_BIT = 8589934592ULL;"));
  EXPECT_TRUE(contains(header,
                       "constexpr VkAccessFlagBits2 VK_ACCESS_2_NONE_KHR = 0ULL;"));
  EXPECT_FALSE(contains(header, "XLIB"));
}

TEST(EmitterTest, DefinitionsFollowDependencies) {
  std::string header = mini({});
  EXPECT_LT(at(header, "using VkFlags64 = uint64_t;"),
            at(header, "using VkAccessFlags2 = VkFlags64;"));
  EXPECT_LT(at(header, "struct VkExtent2D {"),
            at(header, "struct VkQueueFamilyProperties {"));
  EXPECT_LT(at(header, "using PFN_vkAllocationFunction ="),
            at(header, "struct VkAllocationCallbacks {"));
  EXPECT_LT(at(header, "struct VkPhysicalDeviceProperties {"),
            at(header, "struct VkPhysicalDeviceProperties2 {"));
  EXPECT_LT(at(header, "enum VkSystemAllocationScope"),
            at(header, "using PFN_vkAllocationFunction ="));
  EXPECT_LT(at(header, "struct VkPhysicalDeviceProperties2 {"),
            at(header, "using PFN_vkGetPhysicalDeviceProperties2 ="));
}

TEST(EmitterTest, Commands) {
  std::string header = mini({});
  EXPECT_TRUE(contains(header,
                       "using PFN_vkCreateInstance = VkResult (VKBINDGEN_PTR *)"
                       "(const VkInstanceCreateInfo*, const VkAllocationCallbacks*, "
                       "VkInstance*);"));
  EXPECT_TRUE(contains(header,
                       "using PFN_vkGetPhysicalDeviceProperties2KHR = "
                       "PFN_vkGetPhysicalDeviceProperties2;"));
  EXPECT_LT(at(header, "using PFN_vkGetPhysicalDeviceProperties2 ="),
            at(header, "using PFN_vkGetPhysicalDeviceProperties2KHR ="));
}

TEST(EmitterTest, GroupTables) {
  vkr::Registry registry = vkr::parse_registry_file("testdata/mini_vk.xml", {});
  dep::DependencyGraph graph = dep::resolve(registry);
  flt::Selection selection = flt::select(registry, graph, {});
  std::string header = emt::emit_header(registry, selection, {});

  for (const vkr::Group* group : selection.groups) {
    std::vector<std::string> expected;
    for (const vkr::Command* command : selection.commands_of(group))
      expected.push_back(command->name);
    std::string table = emt::identifier(group->name) + "_commands";
    if (expected.empty()) {
      EXPECT_FALSE(contains(header, "struct " + table + " {")) << table;
      continue;
    }
    EXPECT_EQ(visited(header, table), expected) << table;
  }
  EXPECT_FALSE(contains(header, "VK_KHR_acceleration_structure_commands"));
}

TEST(EmitterTest, LevelTables) {
  std::string header = mini({});
  EXPECT_EQ(visited(header, "global_commands"),
            (std::vector<std::string>{"vkCreateInstance",
                                      "vkEnumerateInstanceVersion"}));
  EXPECT_EQ(visited(header, "device_commands"),
            (std::vector<std::string>{"vkDestroyDevice", "vkGetDeviceQueue",
                                      "vkQueueWaitIdle", "vkDestroyFence"}));
  std::vector<std::string> instance = visited(header, "instance_commands");
  EXPECT_EQ(instance.size(), 10u);
  EXPECT_NE(std::find(instance.begin(), instance.end(),
                      "vkGetPhysicalDeviceProperties2KHR"),
            instance.end());

  EXPECT_TRUE(contains(header,
                       "inline global_commands load_global_commands("
                       "PFN_vkGetInstanceProcAddr gipa) {"));
  EXPECT_TRUE(contains(header, "inline instance_commands load_instance_commands("));
  EXPECT_TRUE(contains(header, "inline device_commands load_device_commands("));
  EXPECT_TRUE(contains(header, "void load_commands(Table& table, Resolve&& resolve, Handle handle) {"));
}

TEST(EmitterTest, PlatformGating) {
  flt::Config config;
  config.platforms = {"xlib"};
  std::string header = mini(config);
  const std::string open = "#if defined(VK_USE_PLATFORM_XLIB_KHR)\n";
  EXPECT_TRUE(contains(header, open + "#include <X11/Xlib.h>\n#endif\n"));
  EXPECT_TRUE(contains(header, open + "struct VkXlibSurfaceCreateInfoKHR {\n"));
  EXPECT_TRUE(contains(header, open + "using VkXlibSurfaceCreateFlagsKHR = VkFlags;\n"));
  EXPECT_TRUE(contains(header,
                       open +
                           "  VK_STRUCTURE_TYPE_XLIB_SURFACE_CREATE_INFO_KHR = "
                           "1000004000,\n#endif\n"));
  EXPECT_TRUE(contains(header, open + "struct VK_KHR_xlib_surface_commands {\n"));
  EXPECT_TRUE(contains(header,
                       open + "  PFN_vkCreateXlibSurfaceKHR vkCreateXlibSurfaceKHR "
                              "= nullptr;\n#endif\n"));
  EXPECT_TRUE(contains(header,
                       open + "  V(t.vkCreateXlibSurfaceKHR, "
                              "\"vkCreateXlibSurfaceKHR\");\n#endif\n"));
  // Portable declarations stay ungated.
  EXPECT_TRUE(contains(header, "\nstruct VK_KHR_surface_commands {\n"));
  EXPECT_FALSE(contains(header, open + "struct VK_KHR_surface_commands {\n"));
}

TEST(EmitterHelpersTest, Identifier) {
  EXPECT_EQ(emt::identifier("VK_VERSION_1_0"), "VK_VERSION_1_0");
  EXPECT_EQ(emt::identifier("core-1.0"), "core_1_0");
  EXPECT_EQ(emt::identifier("1.0"), "_1_0");
}

TEST(EmitterHelpersTest, NestedGate) {
  using Set = std::set<std::string>;
  EXPECT_EQ(emt::nested_gate({}, {}), Set{});
  EXPECT_EQ(emt::nested_gate({}, {"A"}), Set{"A"});
  EXPECT_EQ(emt::nested_gate({"A"}, {"A"}), Set{});
  EXPECT_EQ(emt::nested_gate({"A"}, {"A", "B"}), Set{});
  EXPECT_EQ(emt::nested_gate({"A", "B"}, {"A"}), Set{"A"});
  EXPECT_EQ(emt::nested_gate({"A"}, {}), Set{});
}

}  // namespace
