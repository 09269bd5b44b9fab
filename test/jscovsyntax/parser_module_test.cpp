#include <doctest/doctest.h>

#include <string>
#include <string_view>

#include "jscovsyntax/node_kind.hpp"
#include "jscovsyntax/parser.hpp"
#include "jscovsyntax/syntax_error.hpp"

namespace {

using jscov::syntax::node_id;
using jscov::syntax::node_kind;
using jscov::syntax::source_type;
using jscov::syntax::syntax_tree;

size_t count(const syntax_tree& tree, node_kind kind) {
  size_t found = 0;
  tree.walk([&](node_id id, node_id) {
    if (tree.kind(id) == kind) {
      ++found;
    }
  });
  return found;
}

size_t count_functions(const syntax_tree& tree) {
  size_t found = 0;
  tree.walk([&](node_id id, node_id) {
    if (jscov::syntax::is_function(tree.kind(id))) {
      ++found;
    }
  });
  return found;
}

size_t count_grammar(const syntax_tree& tree, std::string_view type) {
  size_t found = 0;
  tree.walk([&](node_id id, node_id) {
    if (tree.grammar_type(id) == type) {
      ++found;
    }
  });
  return found;
}

syntax_tree parse_module(const std::string& source) { return jscov::syntax::parse(source, source_type::module); }

} // namespace

TEST_CASE("module parser accepts every import form") {
  auto tree = parse_module(
      "import a, {b as c, d} from 'm';\n"
      "import * as ns from 'n';\n"
      "import f, * as g from 'o';\n"
      "import 'side';"
  );

  CHECK(count(tree, node_kind::import_declaration) == 4);
  CHECK(count_grammar(tree, "import_specifier") == 2);
  CHECK(count_grammar(tree, "namespace_import") == 2);
}

TEST_CASE("module parser accepts every export form") {
  auto tree = parse_module(
      "export const x = 1;\n"
      "export default function () {}\n"
      "export { x as y };\n"
      "export * from 'a';\n"
      "export * as ns from 'b';\n"
      "export class K {}"
  );

  CHECK(count(tree, node_kind::export_declaration) == 6);
  CHECK(count(tree, node_kind::variable_declaration) == 1);
  CHECK(count(tree, node_kind::class_declaration) == 1);
  CHECK(count_functions(tree) == 1);
  CHECK(count_grammar(tree, "export_specifier") == 1);
}

TEST_CASE("module parser accepts default expressions and top-level await") {
  auto tree = parse_module("export default a + 1;\nawait load();\nfor await (const x of s) {}");
  CHECK(count(tree, node_kind::export_declaration) == 1);
  CHECK(count_grammar(tree, "await_expression") == 1);
  CHECK(count(tree, node_kind::for_of_statement) == 1);
}

TEST_CASE("module parser still requires async functions for nested for await") {
  CHECK_THROWS_AS(parse_module("function f() { for await (const x of s) {} }"), jscov::syntax::syntax_error);
}

TEST_CASE("module parser rejects nested module declarations and with") {
  CHECK_THROWS_AS(parse_module("if (x) { import y from 'z'; }"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_module("function f() { export const a = 1; }"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_module("with (o) { x(); }"), jscov::syntax::syntax_error);
}

TEST_CASE("script parser rejects module syntax") {
  CHECK_THROWS_AS(jscov::syntax::parse("import x from 'y';", source_type::script), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(jscov::syntax::parse("export const x = 1;", source_type::script), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(jscov::syntax::parse("const u = import.meta.url;", source_type::script), jscov::syntax::syntax_error);

  auto tree = parse_module("const u = import.meta.url;");
  CHECK(count(tree, node_kind::variable_declaration) == 1);
}

TEST_CASE("script parser accepts dynamic import, meta properties and with") {
  auto tree = jscov::syntax::parse(
      "import('x').then(m => m); function F() { return new.target; } with (o) { x(); }", source_type::script
  );
  CHECK(count(tree, node_kind::arrow_function_expression) == 1);
  CHECK(count(tree, node_kind::function_declaration) == 1);
  CHECK(count(tree, node_kind::with_statement) == 1);
  CHECK(count_grammar(tree, "meta_property") == 1);
}
