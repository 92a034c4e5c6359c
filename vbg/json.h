#pragma once

#include <glog/logging.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>

#include <cstdint>
#include <memory>
#include <ostream>
#include <string_view>

namespace vbg {

class json_writer {
 public:
  json_writer(std::ostream& o)
      : ostream_wrapper(std::make_unique<rapidjson::OStreamWrapper>(o)),
        writer(*ostream_wrapper) {
    writer.SetIndent(' ', 2);
  }

  void write_null() { CHECK(writer.Null()); }

  void write_bool(bool b) { CHECK(writer.Bool(b)); }

  void write_int(int64_t i) { CHECK(writer.Int64(i)); }

  void write_uint(uint64_t u) { CHECK(writer.Uint64(u)); }

  void write_string(std::string_view sv) {
    CHECK(writer.String(sv.data(), sv.size()));
  }

  void write_key(std::string_view sv) {
    CHECK(writer.Key(sv.data(), sv.size()));
  }

  void start_object() { CHECK(writer.StartObject()); }

  void end_object() { CHECK(writer.EndObject()); }

  void start_array() { CHECK(writer.StartArray()); }

  void end_array() { CHECK(writer.EndArray()); }

  bool complete() const { return writer.IsComplete(); }

 private:
  std::unique_ptr<rapidjson::OStreamWrapper> ostream_wrapper;
  rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer;
};

}  // namespace vbg
