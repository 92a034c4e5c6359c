#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

#include "vbg/error.h"

namespace vbg {

class file_reader {
 public:
  file_reader(const std::filesystem::path& fspath) {
    ifs.exceptions(std::ios::badbit | std::ios::failbit | std::ios::eofbit);
    ifs.open(fspath.string().c_str(), std::ios::binary | std::ios::in);
  }

  size_t size() {
    size_t pos = tell();
    ifs.seekg(0, std::ios::end);
    size_t len = tell();
    seek(pos);
    return len;
  }

  void read(void* buf, size_t n) { ifs.read((char*)buf, n); }

  void seek(size_t pos) { ifs.seekg(pos); }

  size_t tell() { return ifs.tellg(); }

 private:
  std::ifstream ifs;
};

inline std::string load_file(const std::filesystem::path& filename) {
  file_reader reader(filename);
  std::string s;
  s.resize(reader.size());
  if (!s.empty()) reader.read(&s[0], s.size());
  return s;
}

// Writes to a sibling temporary file that only replaces the destination on
// commit(). An uncommitted writer removes its temporary on destruction, so a
// failed run never leaves a partial file behind.
class atomic_file_writer {
 public:
  explicit atomic_file_writer(const std::filesystem::path& fspath)
      : path_(fspath), temp_path_(fspath.string() + ".tmp") {
    try {
      ofs.exceptions(std::ios::badbit | std::ios::failbit);
      ofs.open(temp_path_.string().c_str(),
               std::ios::binary | std::ios::out | std::ios::trunc);
    } catch (const std::ios_base::failure& e) {
      throw emission_failure(temp_path_.string(), e.what());
    }
  }
  atomic_file_writer(const atomic_file_writer&) = delete;
  atomic_file_writer& operator=(const atomic_file_writer&) = delete;

  ~atomic_file_writer() {
    if (committed_) return;
    if (ofs.is_open()) ofs.close();
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
  }

  void write(std::string_view sv) {
    try {
      ofs.write(sv.data(), sv.size());
    } catch (const std::ios_base::failure& e) {
      throw emission_failure(temp_path_.string(), e.what());
    }
  }

  void commit() {
    try {
      ofs.close();
      std::filesystem::rename(temp_path_, path_);
    } catch (const std::ios_base::failure& e) {
      throw emission_failure(path_.string(), e.what());
    } catch (const std::filesystem::filesystem_error& e) {
      throw emission_failure(path_.string(), e.what());
    }
    committed_ = true;
  }

 private:
  std::filesystem::path path_;
  std::filesystem::path temp_path_;
  std::ofstream ofs;
  bool committed_ = false;
};

}  // namespace vbg
