#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "jscovbase/line_index.hpp"
#include "jscovbase/types.hpp"
#include "jscovsyntax/node_kind.hpp"
#include "jscovsyntax/source_type.hpp"

namespace jscov::syntax {

using node_id = uint32_t;
inline constexpr node_id k_invalid_node = 0xFFFF'FFFFu;

struct node {
  node_kind kind = node_kind::invalid;

  // byte offsets into the utf-8 source
  uint32_t byte_start = 0;
  uint32_t byte_end = 0;

  // grammar node type the node was built from, empty for synthesized nodes
  std::string_view grammar_type;

  // engine offsets and source location, filled in by finalize()
  offset_span span{};
  source_location loc{};

  node_id parent = k_invalid_node;
  std::vector<node_id> children;
};

/**
 * @brief Arena of syntax nodes addressed by stable integer ids.
 *
 * Nodes are appended by the tree builder; a node's children are added before the node itself,
 * so every child id is smaller than its parent's. The tree owns a copy of the source text.
 */
class syntax_tree {
public:
  syntax_tree() = default;
  explicit syntax_tree(std::string source, source_type type = source_type::script);

  node_id add(node_kind kind, uint32_t byte_start, uint32_t byte_end, std::vector<node_id> children = {});

  void set_grammar_type(node_id id, std::string_view type) { nodes_[id].grammar_type = type; }
  void set_root(node_id id) { root_ = id; }

  // computes engine spans and locations for every node
  void finalize();

  const node& at(node_id id) const { return nodes_[id]; }
  node_kind kind(node_id id) const { return nodes_[id].kind; }
  const offset_span& span(node_id id) const { return nodes_[id].span; }
  const source_location& loc(node_id id) const { return nodes_[id].loc; }
  node_id parent(node_id id) const { return nodes_[id].parent; }
  const std::vector<node_id>& children(node_id id) const { return nodes_[id].children; }

  std::string_view text(node_id id) const;
  std::string_view grammar_type(node_id id) const { return nodes_[id].grammar_type; }

  node_id root() const { return root_; }
  size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }

  const std::string& source() const { return source_; }
  source_type type() const { return type_; }
  const util::line_index& lines() const { return lines_; }

  /**
   * @brief Visits every node reachable from the root in pre-order.
   *
   * The visitor is called as `visitor(node_id id, node_id parent)`; children are visited in
   * source order, except that do-while visits its test before its body.
   */
  template <typename Visitor> void walk(Visitor&& visitor) const {
    if (root_ == k_invalid_node) {
      return;
    }

    std::vector<std::pair<node_id, node_id>> stack;
    stack.emplace_back(root_, k_invalid_node);
    while (!stack.empty()) {
      auto [id, parent] = stack.back();
      stack.pop_back();
      visitor(id, parent);

      const auto& kids = nodes_[id].children;
      for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
        stack.emplace_back(*it, id);
      }
    }
  }

private:
  std::string source_;
  source_type type_ = source_type::script;
  util::line_index lines_;
  std::vector<node> nodes_;
  node_id root_ = k_invalid_node;
};

} // namespace jscov::syntax
