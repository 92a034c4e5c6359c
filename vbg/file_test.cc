#include "vbg/file.h"

#include <unistd.h>

#include <filesystem>

#include "gtest/gtest.h"
#include "vbg/error.h"

namespace {

class AtomicFileWriterTest : public testing::Test {
 public:
  AtomicFileWriterTest()
      : dir(std::filesystem::temp_directory_path() /
            ("vbg_file_test_" + std::to_string(::getpid()))) {
    std::filesystem::create_directories(dir);
  }
  ~AtomicFileWriterTest() { std::filesystem::remove_all(dir); }

  std::filesystem::path dir;
};

TEST_F(AtomicFileWriterTest, Commit) {
  std::filesystem::path path = dir / "out.h";
  {
    vbg::atomic_file_writer writer(path);
    writer.write("namespace vkb {\n");
    writer.write("constexpr uint32_t N = 16;\n");
    EXPECT_FALSE(std::filesystem::exists(path));
    writer.commit();
  }
  EXPECT_EQ(vbg::load_file(path),
            "namespace vkb {\nconstexpr uint32_t N = 16;\n");
  EXPECT_FALSE(std::filesystem::exists(dir / "out.h.tmp"));
}

TEST_F(AtomicFileWriterTest, UncommittedLeavesNothing) {
  std::filesystem::path path = dir / "out.h";
  {
    vbg::atomic_file_writer writer(path);
    writer.write("partial");
  }
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_FALSE(std::filesystem::exists(dir / "out.h.tmp"));
}

TEST_F(AtomicFileWriterTest, UncommittedKeepsPreviousOutput) {
  std::filesystem::path path = dir / "out.h";
  {
    vbg::atomic_file_writer writer(path);
    writer.write("old");
    writer.commit();
  }
  {
    vbg::atomic_file_writer writer(path);
    writer.write("new");
  }
  EXPECT_EQ(vbg::load_file(path), "old");
}

TEST_F(AtomicFileWriterTest, UnwritableDirectory) {
  EXPECT_THROW(
      { vbg::atomic_file_writer writer(dir / "missing" / "out.h"); },
      vbg::emission_failure);
}

TEST(LoadFileTest, Missing) {
  EXPECT_THROW(vbg::load_file("testdata/does_not_exist.xml"),
               std::ios_base::failure);
}

}  // namespace
