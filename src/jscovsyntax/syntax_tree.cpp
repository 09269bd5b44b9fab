#include "syntax_tree.hpp"

#include <utility>

namespace jscov::syntax {

syntax_tree::syntax_tree(std::string source, source_type type)
    : source_(std::move(source)), type_(type), lines_(source_) {}

node_id syntax_tree::add(node_kind kind, uint32_t byte_start, uint32_t byte_end, std::vector<node_id> children) {
  node_id id = static_cast<node_id>(nodes_.size());
  for (node_id child : children) {
    nodes_[child].parent = id;
  }

  node entry;
  entry.kind = kind;
  entry.byte_start = byte_start;
  entry.byte_end = byte_end < byte_start ? byte_start : byte_end;
  entry.children = std::move(children);
  nodes_.push_back(std::move(entry));
  return id;
}

void syntax_tree::finalize() {
  for (auto& entry : nodes_) {
    entry.span.start = lines_.engine_offset(entry.byte_start);
    entry.span.end = lines_.engine_offset(entry.byte_end);
    entry.loc.start = lines_.position(entry.byte_start);
    entry.loc.end = lines_.position(entry.byte_end);
  }
}

std::string_view syntax_tree::text(node_id id) const {
  const auto& entry = nodes_[id];
  return std::string_view(source_).substr(entry.byte_start, entry.byte_end - entry.byte_start);
}

} // namespace jscov::syntax
