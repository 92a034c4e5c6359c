#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace vbg {

// Base of every failure that aborts a generation run.
class error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// The registry document violates the expected schema.
class malformed_registry : public error {
 public:
  malformed_registry(const std::string& message, const std::string& location);

  const std::string& message() const { return message_; }
  const std::string& location() const { return location_; }

 private:
  std::string message_;
  std::string location_;
};

class cyclic_type_dependency : public error {
 public:
  explicit cyclic_type_dependency(std::vector<std::string> cycle);

  const std::vector<std::string>& cycle() const { return cycle_; }

 private:
  std::vector<std::string> cycle_;
};

// A kept entity references an entity the filter removed.
class dangling_reference : public error {
 public:
  dangling_reference(const std::string& name, const std::string& referrer);

  const std::string& name() const { return name_; }
  const std::string& referrer() const { return referrer_; }

 private:
  std::string name_;
  std::string referrer_;
};

class emission_failure : public error {
 public:
  emission_failure(const std::string& path, const std::string& cause);

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace vbg
