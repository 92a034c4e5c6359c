#include "emt/loader_expander.h"

#include "vbg/log.h"

namespace emt {

LoadEntry::LoadEntry(const std::string& table, const vkr::Command& command,
                     std::set<std::string> platforms)
    : table_(table), command_(&command), platforms_(std::move(platforms)) {}

void expand_visitor(code_builder& out, const std::string& table,
                    const std::vector<LoadEntry>& entries) {
  out.println("template <class Visitor>");
  out.println("void visit_commands(", table, "& t, const Visitor& V) {");
  out.indent();
  for (const LoadEntry& entry : entries) {
    VBG_ASSERT_EQ(entry.table(), table);
    out.open_gate(entry.platforms());
    out.println("V(t.", entry.field(), ", \"", entry.entry_point(), "\");");
    out.close_gate(entry.platforms());
  }
  out.dedent();
  out.println("}");
}

}  // namespace emt
