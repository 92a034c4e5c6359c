#pragma once

#include <set>
#include <string>
#include <vector>

#include "emt/code_builder.h"
#include "vkr/registry.h"

namespace emt {

// One command table field and the entry point that fills it. Entries are
// only made from parsed Command entities, and the field and entry point are
// the command's registry name verbatim.
class LoadEntry {
 public:
  LoadEntry(const std::string& table, const vkr::Command& command,
            std::set<std::string> platforms);

  const std::string& table() const { return table_; }
  const std::string& field() const { return command_->name; }
  const std::string& entry_point() const { return command_->name; }
  const vkr::Command& command() const { return *command_; }
  // Protect macros guarding the field; empty when unconditional.
  const std::set<std::string>& platforms() const { return platforms_; }

 private:
  std::string table_;
  const vkr::Command* command_;
  std::set<std::string> platforms_;
};

// Writes the visit_commands overload for `table`: one
// V(t.<field>, "<entry_point>"); line per entry.
void expand_visitor(code_builder& out, const std::string& table,
                    const std::vector<LoadEntry>& entries);

}  // namespace emt
