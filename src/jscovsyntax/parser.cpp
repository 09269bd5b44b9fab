#include "parser.hpp"

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <vector>

#include <redlog.hpp>
#include <tree_sitter/api.h>

#include "jscovsyntax/syntax_error.hpp"

extern "C" const TSLanguage* tree_sitter_javascript(void);

namespace jscov::syntax {

namespace {

struct grammar_mapping {
  std::string_view type;
  node_kind kind;
};

// grammar node types with a dedicated kind; method_definition and for_in_statement are refined
// by kind_for()
constexpr grammar_mapping k_grammar_kinds[] = {
    {"statement_block", node_kind::block_statement},
    {"empty_statement", node_kind::empty_statement},
    {"expression_statement", node_kind::expression_statement},
    {"variable_declaration", node_kind::variable_declaration},
    {"lexical_declaration", node_kind::variable_declaration},
    {"if_statement", node_kind::if_statement},
    {"for_statement", node_kind::for_statement},
    {"for_in_statement", node_kind::for_in_statement},
    {"while_statement", node_kind::while_statement},
    {"do_statement", node_kind::do_while_statement},
    {"return_statement", node_kind::return_statement},
    {"break_statement", node_kind::break_statement},
    {"continue_statement", node_kind::continue_statement},
    {"throw_statement", node_kind::throw_statement},
    {"try_statement", node_kind::try_statement},
    {"switch_statement", node_kind::switch_statement},
    {"labeled_statement", node_kind::labeled_statement},
    {"debugger_statement", node_kind::debugger_statement},
    {"with_statement", node_kind::with_statement},
    {"function_declaration", node_kind::function_declaration},
    {"generator_function_declaration", node_kind::function_declaration},
    {"class_declaration", node_kind::class_declaration},
    {"import_statement", node_kind::import_declaration},
    {"export_statement", node_kind::export_declaration},
    {"function_expression", node_kind::function_expression},
    {"function", node_kind::function_expression},
    {"generator_function", node_kind::function_expression},
    {"arrow_function", node_kind::arrow_function_expression},
    {"method_definition", node_kind::class_method},
    {"variable_declarator", node_kind::variable_declarator},
    {"switch_case", node_kind::switch_case},
    {"switch_default", node_kind::switch_case},
    {"catch_clause", node_kind::catch_clause},
    {"class", node_kind::class_expression},
    {"class_body", node_kind::class_body},
    {"field_definition", node_kind::class_property},
    {"public_field_definition", node_kind::class_property},
    {"class_static_block", node_kind::static_block},
};

// grammar nodes that produce no node; their children are attached to the enclosing node
bool is_transparent(std::string_view type) {
  return type == "parenthesized_expression" || type == "else_clause" || type == "finally_clause" ||
         type == "switch_body";
}

bool is_skipped(std::string_view type) {
  return type == "comment" || type == "html_comment" || type == "hash_bang_line";
}

bool field_is(TSNode parent, uint32_t index, std::string_view name) {
  const char* field = ts_node_field_name_for_child(parent, index);
  return field != nullptr && name == field;
}

bool has_token(TSNode node, std::string_view token) {
  uint32_t count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    TSNode child = ts_node_child(node, i);
    if (!ts_node_is_named(child) && token == ts_node_type(child)) {
      return true;
    }
  }
  return false;
}

TSNode child_by_field(TSNode node, std::string_view field) {
  return ts_node_child_by_field_name(node, field.data(), static_cast<uint32_t>(field.size()));
}

// depth-first search for the first ERROR or MISSING node
TSNode first_error(TSNode node) {
  if (ts_node_is_missing(node) || std::string_view(ts_node_type(node)) == "ERROR") {
    return node;
  }

  uint32_t count = ts_node_child_count(node);
  for (uint32_t i = 0; i < count; ++i) {
    TSNode child = ts_node_child(node, i);
    if (!ts_node_has_error(child)) {
      continue;
    }
    TSNode found = first_error(child);
    if (!ts_node_is_null(found)) {
      return found;
    }
  }
  return TSNode{};
}

/**
 * Converts a tree-sitter JavaScript tree into syntax_tree nodes and rejects the constructs the
 * grammar accepts but the given source type does not.
 */
class tree_builder {
public:
  tree_builder(syntax_tree& tree, source_type type) : tree_(tree), type_(type) {}

  node_id build_program(TSNode root) {
    std::vector<node_id> body;
    build_statements(root, scope{}, body);

    node_id program =
        tree_.add(node_kind::program, 0, static_cast<uint32_t>(tree_.source().size()), std::move(body));
    tree_.set_grammar_type(program, ts_node_type(root));
    return program;
  }

  [[noreturn]] void report_error(TSNode root) const {
    TSNode error = first_error(root);
    if (ts_node_is_null(error)) {
      fail("unexpected token", ts_node_start_byte(root));
    }

    uint32_t offset = ts_node_start_byte(error);
    if (ts_node_is_missing(error)) {
      fail("missing '" + std::string(ts_node_type(error)) + "'", offset);
    }
    if (offset >= tree_.source().size()) {
      fail("unexpected end of input", offset);
    }

    TSNode token = error;
    while (ts_node_child_count(token) > 0) {
      token = ts_node_child(token, 0);
    }
    std::string_view token_text = text(token);
    if (token_text.empty()) {
      fail("unexpected token", offset);
    }
    fail("unexpected token '" + std::string(token_text.substr(0, 32)) + "'", offset);
  }

private:
  struct scope {
    bool in_function = false;
    bool is_async = false;
    bool in_class = false;
  };

  void build(TSNode ts, const scope& ctx, std::vector<node_id>& out) {
    std::string_view type = ts_node_type(ts);
    if (!ts_node_is_named(ts) || is_skipped(type)) {
      return;
    }

    check(ts, type, ctx);
    if (is_transparent(type)) {
      build_children(ts, ctx, out);
      return;
    }

    node_kind kind = kind_for(ts, type);
    scope inner = ctx;
    if (is_function(kind)) {
      inner.in_function = true;
      inner.is_async = has_token(ts, "async");
    } else if (kind == node_kind::static_block) {
      inner.in_function = true;
      inner.is_async = false;
    } else if (kind == node_kind::class_body) {
      inner.in_class = true;
    }

    std::vector<node_id> children;
    if (is_function(kind)) {
      build_function_parts(ts, inner, children);
    } else if (kind == node_kind::for_statement) {
      build_for_parts(ts, inner, children);
    } else if ((kind == node_kind::for_in_statement || kind == node_kind::for_of_statement) &&
               !ts_node_is_null(child_by_field(ts, "kind"))) {
      build_for_each_parts(ts, inner, children);
    } else if (kind == node_kind::do_while_statement) {
      build_do_while_parts(ts, inner, children);
    } else {
      build_children(ts, inner, children);
    }

    out.push_back(add(ts, kind, ts_node_end_byte(ts), std::move(children)));
  }

  void build_children(TSNode ts, const scope& ctx, std::vector<node_id>& out) {
    uint32_t count = ts_node_named_child_count(ts);
    for (uint32_t i = 0; i < count; ++i) {
      build(ts_node_named_child(ts, i), ctx, out);
    }
  }

  // statement list of a program or function body, leading string statements become directives
  void build_statements(TSNode ts, const scope& ctx, std::vector<node_id>& out) {
    bool prologue = true;
    uint32_t count = ts_node_named_child_count(ts);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_named_child(ts, i);
      if (is_skipped(ts_node_type(child))) {
        continue;
      }
      if (prologue && is_directive(child)) {
        out.push_back(add(child, node_kind::directive, ts_node_end_byte(child), {}));
        continue;
      }
      prologue = false;
      build(child, ctx, out);
    }
  }

  void build_function_parts(TSNode ts, const scope& ctx, std::vector<node_id>& out) {
    uint32_t count = ts_node_child_count(ts);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_child(ts, i);
      if (field_is(ts, i, "body") && std::string_view(ts_node_type(child)) == "statement_block") {
        std::vector<node_id> body;
        build_statements(child, ctx, body);
        out.push_back(add(child, node_kind::block_statement, ts_node_end_byte(child), std::move(body)));
        continue;
      }
      build(child, ctx, out);
    }
  }

  // `for (init; test; update)`: header statements contribute their expression only
  void build_for_parts(TSNode ts, const scope& ctx, std::vector<node_id>& out) {
    uint32_t count = ts_node_child_count(ts);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_child(ts, i);
      if (!ts_node_is_named(child)) {
        continue;
      }
      if (!field_is(ts, i, "initializer") && !field_is(ts, i, "condition")) {
        build(child, ctx, out);
        continue;
      }

      std::string_view type = ts_node_type(child);
      if (type == "empty_statement") {
        continue;
      }
      if (type == "expression_statement") {
        build_children(child, ctx, out);
        continue;
      }
      if (type == "variable_declaration" || type == "lexical_declaration") {
        std::vector<node_id> declarators;
        build_children(child, ctx, declarators);
        uint32_t end = ts_node_end_byte(child);
        if (end > ts_node_start_byte(child) && tree_.source()[end - 1] == ';') {
          --end;
        }
        out.push_back(add(child, node_kind::variable_declaration, end, std::move(declarators)));
        continue;
      }
      build(child, ctx, out);
    }
  }

  // `for (const x of y)`: the grammar keeps the declaration keyword and binding inline
  void build_for_each_parts(TSNode ts, const scope& ctx, std::vector<node_id>& out) {
    TSNode keyword = child_by_field(ts, "kind");
    TSNode left = child_by_field(ts, "left");
    TSNode value = child_by_field(ts, "value");

    uint32_t count = ts_node_child_count(ts);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_child(ts, i);
      if (field_is(ts, i, "value") || field_is(ts, i, "kind")) {
        continue;
      }
      if (!field_is(ts, i, "left")) {
        build(child, ctx, out);
        continue;
      }

      uint32_t end = ts_node_is_null(value) ? ts_node_end_byte(left) : ts_node_end_byte(value);
      std::vector<node_id> parts;
      build(left, ctx, parts);
      if (!ts_node_is_null(value)) {
        build(value, ctx, parts);
      }
      node_id declarator = tree_.add(node_kind::variable_declarator, ts_node_start_byte(left), end, std::move(parts));
      out.push_back(tree_.add(node_kind::variable_declaration, ts_node_start_byte(keyword), end, {declarator}));
    }
  }

  // the test is visited before the body
  void build_do_while_parts(TSNode ts, const scope& ctx, std::vector<node_id>& out) {
    std::vector<node_id> body;
    uint32_t count = ts_node_child_count(ts);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_child(ts, i);
      build(child, ctx, field_is(ts, i, "body") ? body : out);
    }
    out.insert(out.end(), body.begin(), body.end());
  }

  node_kind kind_for(TSNode ts, std::string_view type) const {
    if (type == "method_definition") {
      TSNode parent = ts_node_parent(ts);
      if (!ts_node_is_null(parent) && std::string_view(ts_node_type(parent)) == "object") {
        return node_kind::object_method;
      }
      TSNode name = child_by_field(ts, "name");
      if (!ts_node_is_null(name) && std::string_view(ts_node_type(name)) == "private_property_identifier") {
        return node_kind::class_private_method;
      }
      return node_kind::class_method;
    }
    if (type == "for_in_statement") {
      TSNode op = child_by_field(ts, "operator");
      if (!ts_node_is_null(op) && text(op) == "of") {
        return node_kind::for_of_statement;
      }
      return node_kind::for_in_statement;
    }

    for (const auto& mapping : k_grammar_kinds) {
      if (mapping.type == type) {
        return mapping.kind;
      }
    }
    return node_kind::other;
  }

  // an expression statement made of a single string literal
  bool is_directive(TSNode ts) const {
    if (std::string_view(ts_node_type(ts)) != "expression_statement") {
      return false;
    }

    TSNode literal{};
    uint32_t count = ts_node_named_child_count(ts);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_named_child(ts, i);
      if (is_skipped(ts_node_type(child))) {
        continue;
      }
      if (!ts_node_is_null(literal)) {
        return false;
      }
      literal = child;
    }
    return !ts_node_is_null(literal) && std::string_view(ts_node_type(literal)) == "string";
  }

  void check(TSNode ts, std::string_view type, const scope& ctx) const {
    uint32_t offset = ts_node_start_byte(ts);

    if (type == "import_statement" || type == "export_statement") {
      if (type_ == source_type::script) {
        fail("'import' and 'export' may appear only in modules", offset);
      }
      TSNode parent = ts_node_parent(ts);
      if (ts_node_is_null(parent) || std::string_view(ts_node_type(parent)) != "program") {
        fail("'import' and 'export' may only appear at the top level", offset);
      }
    } else if (type == "meta_property" || type == "member_expression") {
      // grammar versions differ: import.meta is a meta_property or a member of the `import` node
      if (type_ == source_type::script && is_import_meta(ts, type)) {
        fail("'import.meta' may appear only in modules", offset);
      }
    } else if (type == "for_in_statement") {
      bool top_level_await = type_ == source_type::module && !ctx.in_function;
      if (has_token(ts, "await") && !ctx.is_async && !top_level_await) {
        fail("'for await' is only valid in async functions and at the top level of modules", offset);
      }
    } else if (type == "private_property_identifier") {
      if (!ctx.in_class) {
        fail("private name " + std::string(text(ts)) + " is not defined", offset);
      }
    } else if (type == "with_statement") {
      if (type_ == source_type::module) {
        fail("'with' is not allowed in strict mode", offset);
      }
    }
  }

  bool is_import_meta(TSNode ts, std::string_view type) const {
    if (type == "meta_property") {
      return text(ts).substr(0, 6) == "import";
    }
    TSNode object = child_by_field(ts, "object");
    TSNode property = child_by_field(ts, "property");
    return !ts_node_is_null(object) && !ts_node_is_null(property) &&
           std::string_view(ts_node_type(object)) == "import" && text(property) == "meta";
  }

  node_id add(TSNode ts, node_kind kind, uint32_t end, std::vector<node_id> children) {
    node_id id = tree_.add(kind, ts_node_start_byte(ts), end, std::move(children));
    tree_.set_grammar_type(id, ts_node_type(ts));
    return id;
  }

  std::string_view text(TSNode ts) const {
    uint32_t start = ts_node_start_byte(ts);
    uint32_t end = ts_node_end_byte(ts);
    return std::string_view(tree_.source()).substr(start, end - start);
  }

  [[noreturn]] void fail(const std::string& message, uint32_t offset) const {
    throw syntax_error(message, offset, tree_.lines().position(offset));
  }

  syntax_tree& tree_;
  source_type type_;
};

} // namespace

syntax_tree parse(std::string source, source_type type) {
  auto log = redlog::get_logger("jscov.parser");
  syntax_tree tree(std::move(source), type);

  std::unique_ptr<TSParser, decltype(&ts_parser_delete)> ts_parser(ts_parser_new(), &ts_parser_delete);
  if (!ts_parser_set_language(ts_parser.get(), tree_sitter_javascript())) {
    throw std::runtime_error("tree-sitter-javascript grammar does not match the tree-sitter runtime");
  }

  const std::string& text = tree.source();
  std::unique_ptr<TSTree, decltype(&ts_tree_delete)> ts_tree(
      ts_parser_parse_string(ts_parser.get(), nullptr, text.data(), static_cast<uint32_t>(text.size())),
      &ts_tree_delete
  );
  if (!ts_tree) {
    throw syntax_error("source could not be parsed", 0, tree.lines().position(0));
  }

  TSNode root = ts_tree_root_node(ts_tree.get());
  tree_builder builder(tree, type);
  if (ts_node_has_error(root)) {
    builder.report_error(root);
  }

  tree.set_root(builder.build_program(root));
  tree.finalize();

  log.dbg(
      "parsed program", redlog::field("source_type", source_type_name(type)), redlog::field("nodes", tree.size()),
      redlog::field("bytes", tree.source().size())
  );
  return tree;
}

} // namespace jscov::syntax
