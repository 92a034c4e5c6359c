#include "bindgen/pipeline.h"

#include <rapidjson/document.h>
#include <unistd.h>

#include <filesystem>

#include "gtest/gtest.h"
#include "vbg/error.h"
#include "vbg/file.h"
#include "vkr/registry_parser.h"

namespace {

class PipelineTest : public testing::Test {
 protected:
  PipelineTest()
      : registry(vkr::parse_registry_file("testdata/mini_vk.xml", {})) {}

  bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
  }

  vkr::Registry registry;
};

TEST_F(PipelineTest, HeaderOnly) {
  bindgen::Output output = bindgen::generate(registry, {});
  EXPECT_TRUE(contains(output.header, "namespace vkb {"));
  EXPECT_TRUE(contains(output.header, "struct VK_VERSION_1_0_commands {"));
  EXPECT_FALSE(contains(output.header, "VK_KHR_xlib_surface_commands"));
  EXPECT_TRUE(output.abi_check.empty());
  EXPECT_TRUE(output.json.empty());
}

TEST_F(PipelineTest, AbiCheck) {
  bindgen::Options options;
  options.filter.platforms = {"xlib"};
  options.abi_check_include = "mini_vk_bindings.h";
  bindgen::Output output = bindgen::generate(registry, options);
  const std::string& check = output.abi_check;
  EXPECT_TRUE(contains(check,
                       "#ifndef VK_USE_PLATFORM_XLIB_KHR\n"
                       "#define VK_USE_PLATFORM_XLIB_KHR\n"
                       "#endif\n"));
  EXPECT_LT(check.find("#include \"mini_vk_bindings.h\""),
            check.find("#include <vulkan/vulkan.h>"));
  EXPECT_LT(check.find("constexpr auto constant_VK_UUID_SIZE = vkb::VK_UUID_SIZE;"),
            check.find("#include <vulkan/vulkan.h>"));
  EXPECT_TRUE(contains(check,
                       "ABITEST_CHECK_CONSTANT(abi_values::constant_VK_UUID_SIZE, "
                       "VK_UUID_SIZE)"));
  EXPECT_TRUE(contains(check, "ABITEST_CHECK_STRUCT(vkb::VkExtent2D, VkExtent2D)"));
  EXPECT_TRUE(contains(check,
                       "ABITEST_CHECK_STRUCT_MEMBER(vkb::VkExtent2D, VkExtent2D, "
                       "height)"));
  EXPECT_TRUE(contains(check,
                       "ABITEST_CHECK_STRUCT_MEMBER(vkb::VkAccelerationStructureInstanceKHR, "
                       "VkAccelerationStructureInstanceKHR, transform)"));
  EXPECT_FALSE(contains(check, "instanceCustomIndex"));
  EXPECT_TRUE(contains(check, "ABITEST_CHECK_ENUMERATOR(vkb::VK_SUCCESS, VK_SUCCESS)"));
  EXPECT_TRUE(contains(check, "ABITEST_CHECK_SIZE(vkb::VkFence, VkFence)"));
  EXPECT_TRUE(contains(check,
                       "ABITEST_CHECK_FUNCPOINTER(vkb::PFN_vkCreateInstance, "
                       "PFN_vkCreateInstance)"));
  EXPECT_TRUE(contains(check,
                       "#if defined(VK_USE_PLATFORM_XLIB_KHR)\n"
                       "ABITEST_CHECK_FUNCPOINTER(vkb::PFN_vkCreateXlibSurfaceKHR, "
                       "PFN_vkCreateXlibSurfaceKHR)\n"
                       "#endif\n"));
  EXPECT_TRUE(contains(check, "\nABITEST_MAIN\n"));
}

TEST_F(PipelineTest, Json) {
  bindgen::Options options;
  options.json = true;
  bindgen::Output output = bindgen::generate(registry, options);

  rapidjson::Document document;
  document.Parse(output.json.c_str());
  ASSERT_FALSE(document.HasParseError());
  ASSERT_TRUE(document.IsObject());
  EXPECT_STREQ(document["api"].GetString(), "vulkan");
  EXPECT_EQ(document["header_version"].GetUint(), 250u);
  EXPECT_STREQ(document["platforms"]["xlib"].GetString(),
               "VK_USE_PLATFORM_XLIB_KHR");
  ASSERT_TRUE(document["types"].IsArray());
  ASSERT_TRUE(document["commands"].IsArray());
  EXPECT_EQ(document["commands"].Size(), registry.commands.size());
  ASSERT_TRUE(document["groups"].IsArray());
  EXPECT_EQ(document["groups"].Size(), registry.groups.size());

  // The dump covers the whole registry, not only the selection.
  bool xlib = false;
  for (const auto& group : document["groups"].GetArray())
    if (std::string(group["name"].GetString()) == "VK_KHR_xlib_surface") {
      xlib = true;
      EXPECT_STREQ(group["platform"].GetString(), "xlib");
    }
  EXPECT_TRUE(xlib);
}

TEST_F(PipelineTest, Namespace) {
  bindgen::Options options;
  options.emit.ns = "gfx";
  options.abi_check_include = "gfx.h";
  bindgen::Output output = bindgen::generate(registry, options);
  EXPECT_TRUE(contains(output.header, "namespace gfx {"));
  EXPECT_TRUE(contains(output.abi_check, "ABITEST_CHECK_SIZE(gfx::VkFence, VkFence)"));
}

TEST_F(PipelineTest, DanglingReference) {
  bindgen::Options options;
  options.filter.excluded_groups = {"VK_VERSION_1_0"};
  EXPECT_THROW(bindgen::generate(registry, options), vbg::dangling_reference);
}

class WriteOutputsTest : public testing::Test {
 public:
  WriteOutputsTest()
      : dir(std::filesystem::temp_directory_path() /
            ("vkbindgen_pipeline_test_" + std::to_string(::getpid()))) {
    std::filesystem::create_directories(dir);
  }
  ~WriteOutputsTest() { std::filesystem::remove_all(dir); }

  std::string path(const std::string& name) { return (dir / name).string(); }

  std::filesystem::path dir;
};

TEST_F(WriteOutputsTest, WritesEveryFile) {
  bindgen::write_outputs({{path("vkb.h"), "header"}, {path("vkb.json"), "{}"}});
  EXPECT_EQ(vbg::load_file(path("vkb.h")), "header");
  EXPECT_EQ(vbg::load_file(path("vkb.json")), "{}");
}

TEST_F(WriteOutputsTest, FailureLeavesNoOutput) {
  EXPECT_THROW(bindgen::write_outputs({{path("vkb.h"), "header"},
                                       {path("missing/vkb.json"), "{}"}}),
               vbg::emission_failure);
  EXPECT_FALSE(std::filesystem::exists(path("vkb.h")));
  EXPECT_FALSE(std::filesystem::exists(path("vkb.h.tmp")));
}

TEST_F(WriteOutputsTest, FailureKeepsPreviousOutput) {
  bindgen::write_outputs({{path("vkb.h"), "old"}});
  EXPECT_THROW(bindgen::write_outputs({{path("vkb.h"), "new"},
                                       {path("missing/vkb_abi.cc"), ""}}),
               vbg::emission_failure);
  EXPECT_EQ(vbg::load_file(path("vkb.h")), "old");
}

}  // namespace
