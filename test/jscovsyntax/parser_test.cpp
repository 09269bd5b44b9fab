#include <doctest/doctest.h>

#include <string>
#include <string_view>
#include <vector>

#include "jscovsyntax/node_kind.hpp"
#include "jscovsyntax/parser.hpp"
#include "jscovsyntax/syntax_error.hpp"

namespace {

using jscov::offset_span;
using jscov::syntax::node_id;
using jscov::syntax::node_kind;
using jscov::syntax::source_type;
using jscov::syntax::syntax_tree;

std::vector<node_id> find_all(const syntax_tree& tree, node_kind kind) {
  std::vector<node_id> found;
  tree.walk([&](node_id id, node_id) {
    if (tree.kind(id) == kind) {
      found.push_back(id);
    }
  });
  return found;
}

size_t count(const syntax_tree& tree, node_kind kind) { return find_all(tree, kind).size(); }

size_t count_grammar(const syntax_tree& tree, std::string_view type) {
  size_t found = 0;
  tree.walk([&](node_id id, node_id) {
    if (tree.grammar_type(id) == type) {
      ++found;
    }
  });
  return found;
}

syntax_tree parse_script(const std::string& source) { return jscov::syntax::parse(source, source_type::script); }

} // namespace

TEST_CASE("parser produces estree spans for a function declaration") {
  auto tree = parse_script("function f(){1;2;}");

  CHECK(tree.kind(tree.root()) == node_kind::program);
  CHECK(tree.span(tree.root()) == offset_span{0, 18});

  auto functions = find_all(tree, node_kind::function_declaration);
  REQUIRE(functions.size() == 1);
  CHECK(tree.span(functions[0]) == offset_span{0, 18});

  auto statements = find_all(tree, node_kind::expression_statement);
  REQUIRE(statements.size() == 2);
  CHECK(tree.span(statements[0]) == offset_span{13, 15});
  CHECK(tree.span(statements[1]) == offset_span{15, 17});

  auto blocks = find_all(tree, node_kind::block_statement);
  REQUIRE(blocks.size() == 1);
  CHECK(tree.span(blocks[0]) == offset_span{12, 18});
}

TEST_CASE("parser spans the program over the whole text") {
  auto tree = parse_script("  // lead\nx();\n\n/* tail */\n");
  CHECK(tree.span(tree.root()) == offset_span{0, 27});
  CHECK(count(tree, node_kind::expression_statement) == 1);
  CHECK(count_grammar(tree, "comment") == 0);
}

TEST_CASE("parser reports line and column locations") {
  auto tree = parse_script("function f() {\n  return 1;\n}");

  auto function = find_all(tree, node_kind::function_declaration).at(0);
  CHECK(tree.loc(function).start == jscov::source_position{1, 0});
  CHECK(tree.loc(function).end == jscov::source_position{3, 1});

  auto ret = find_all(tree, node_kind::return_statement).at(0);
  CHECK(tree.loc(ret).start == jscov::source_position{2, 2});
  CHECK(tree.loc(ret).end == jscov::source_position{2, 11});
}

TEST_CASE("parser counts offsets in utf-16 code units") {
  auto tree = parse_script("var s = '\xf0\x9f\x98\x80'; f();");

  CHECK(tree.span(tree.root()) == offset_span{0, 18});
  auto declaration = find_all(tree, node_kind::variable_declaration).at(0);
  CHECK(tree.span(declaration) == offset_span{0, 13});
  auto call = find_all(tree, node_kind::expression_statement).at(0);
  CHECK(tree.span(call) == offset_span{14, 18});
}

TEST_CASE("parser ends statements without a semicolon at their last token") {
  auto tree = parse_script("a = 1\nb = 2\n");

  auto statements = find_all(tree, node_kind::expression_statement);
  REQUIRE(statements.size() == 2);
  CHECK(tree.span(statements[0]) == offset_span{0, 5});
  CHECK(tree.span(statements[1]) == offset_span{6, 11});
}

TEST_CASE("parser turns a leading string prologue into directives") {
  auto tree = parse_script("'use strict';\n\"other\";\nfoo();\n'not a directive';");

  CHECK(count(tree, node_kind::directive) == 2);
  CHECK(count(tree, node_kind::expression_statement) == 2);

  auto in_function = parse_script("function f() { 'use strict'; return 1; }");
  CHECK(count(in_function, node_kind::directive) == 1);
  CHECK(count(in_function, node_kind::return_statement) == 1);

  auto not_prologue = parse_script("('use strict'); 'x'.length;");
  CHECK(count(not_prologue, node_kind::directive) == 0);
  CHECK(count(not_prologue, node_kind::expression_statement) == 2);
}

TEST_CASE("parser starts methods and arrows at their first token") {
  auto tree = parse_script("const o = { m() {}, get x() { return 1; }, a: async () => 1 };");

  auto methods = find_all(tree, node_kind::object_method);
  REQUIRE(methods.size() == 2);
  CHECK(tree.span(methods[0]) == offset_span{12, 18});
  CHECK(tree.span(methods[1]) == offset_span{20, 41});

  auto arrows = find_all(tree, node_kind::arrow_function_expression);
  REQUIRE(arrows.size() == 1);
  CHECK(tree.span(arrows[0]) == offset_span{46, 59});
}

TEST_CASE("parser drops parentheses but keeps the outer start of the operand") {
  auto tree = parse_script("(a).b;");
  CHECK(count_grammar(tree, "parenthesized_expression") == 0);

  auto statement = find_all(tree, node_kind::expression_statement).at(0);
  auto member = tree.children(statement).at(0);
  CHECK(tree.grammar_type(member) == "member_expression");
  CHECK(tree.kind(member) == node_kind::other);
  CHECK(tree.span(member) == offset_span{0, 5});

  auto inner = tree.children(member).at(0);
  CHECK(tree.grammar_type(inner) == "identifier");
  CHECK(tree.span(inner) == offset_span{1, 2});
}

TEST_CASE("parser parses class members") {
  auto tree = parse_script("class A extends B { static #p = 1; static { init(); } async *gen() {} #m() {} get v() { return 0; } x; }");

  CHECK(count(tree, node_kind::class_declaration) == 1);
  CHECK(count(tree, node_kind::class_body) == 1);
  CHECK(count(tree, node_kind::class_property) == 2);
  CHECK(count(tree, node_kind::static_block) == 1);
  CHECK(count(tree, node_kind::class_private_method) == 1);
  CHECK(count(tree, node_kind::class_method) == 2);
  CHECK(count(tree, node_kind::expression_statement) == 1);

  auto gen = find_all(tree, node_kind::class_method).at(0);
  CHECK(tree.text(gen) == "async *gen() {}");
}

TEST_CASE("parser orders do-while children test first") {
  auto tree = parse_script("do x(); while (y)");
  auto loop = find_all(tree, node_kind::do_while_statement).at(0);
  const auto& children = tree.children(loop);
  REQUIRE(children.size() == 2);
  CHECK(tree.grammar_type(children[0]) == "identifier");
  CHECK(tree.kind(children[1]) == node_kind::expression_statement);
}

TEST_CASE("parser keeps for headers as expressions and declarations") {
  auto tree = parse_script("for (let i = 0; i < n; i++) x();\nfor (;;) {}");

  CHECK(count(tree, node_kind::for_statement) == 2);
  CHECK(count(tree, node_kind::empty_statement) == 0);
  // only the loop body is a statement
  CHECK(count(tree, node_kind::expression_statement) == 1);

  auto declaration = find_all(tree, node_kind::variable_declaration).at(0);
  CHECK(tree.span(declaration) == offset_span{5, 14});
  CHECK(tree.text(declaration) == "let i = 0");
}

TEST_CASE("parser builds declarations for for-of and for-in bindings") {
  auto tree = parse_script("for (const [k, v] of m) {}\nfor (key in o) {}");

  auto loop = find_all(tree, node_kind::for_of_statement).at(0);
  auto declaration = tree.children(loop).at(0);
  REQUIRE(tree.kind(declaration) == node_kind::variable_declaration);
  CHECK(tree.span(declaration) == offset_span{5, 17});

  auto declarator = tree.children(declaration).at(0);
  CHECK(tree.kind(declarator) == node_kind::variable_declarator);
  CHECK(tree.span(declarator) == offset_span{11, 17});
  CHECK(tree.grammar_type(tree.children(declarator).at(0)) == "array_pattern");

  CHECK(count(tree, node_kind::for_in_statement) == 1);
  CHECK(count(tree, node_kind::variable_declaration) == 1);
}

TEST_CASE("parser tells regular expressions from division") {
  auto tree = parse_script("a = b / c / d; r = /x/g.test(s); if (ok) /y/.exec(t);");
  CHECK(count_grammar(tree, "regex") == 2);
  CHECK(count_grammar(tree, "binary_expression") == 2);
}

TEST_CASE("parser reads arrows whose parameter defaults hold regular expressions") {
  auto closing_paren = parse_script("x = (a = /\\)/) => a;");
  auto arrows = find_all(closing_paren, node_kind::arrow_function_expression);
  REQUIRE(arrows.size() == 1);
  CHECK(closing_paren.span(arrows[0]) == offset_span{4, 19});
  CHECK(count_grammar(closing_paren, "regex") == 1);

  auto class_paren = parse_script("x = (a = /[(]/) => a;");
  CHECK(count(class_paren, node_kind::arrow_function_expression) == 1);
  CHECK(count_grammar(class_paren, "regex") == 1);

  auto after_division = parse_script("x = (a = 1 / 2, b = /)/) => a;");
  CHECK(count(after_division, node_kind::arrow_function_expression) == 1);
  CHECK(count_grammar(after_division, "regex") == 1);
  CHECK(count_grammar(after_division, "binary_expression") == 1);
}

TEST_CASE("parser handles nested template literals") {
  auto tree = parse_script("`a${b}c${`d${e}`}`;");
  CHECK(count_grammar(tree, "template_string") == 2);
  CHECK(count_grammar(tree, "template_substitution") == 3);
  CHECK(count(tree, node_kind::expression_statement) == 1);
}

TEST_CASE("parser parses generators, async functions and labels") {
  auto tree = parse_script(
      "function* g() { yield; yield* other(); }\n"
      "async function h() { await p; for await (const x of s) {} }\n"
      "outer: for (;;) { break outer; }\n"
      "switch (v) { case 1: f(); break; default: g(); }\n"
      "try { t(); } catch { c(); } finally { d(); }"
  );

  CHECK(count(tree, node_kind::function_declaration) == 2);
  CHECK(count_grammar(tree, "yield_expression") == 2);
  CHECK(count_grammar(tree, "await_expression") == 1);
  CHECK(count(tree, node_kind::for_of_statement) == 1);
  CHECK(count(tree, node_kind::labeled_statement) == 1);
  CHECK(count(tree, node_kind::switch_case) == 2);
  CHECK(count(tree, node_kind::catch_clause) == 1);
  CHECK(count(tree, node_kind::try_statement) == 1);
  CHECK(count(tree, node_kind::break_statement) == 2);
}

TEST_CASE("parser walk visits every node once with its parent") {
  auto tree = parse_script("var a = [1, 2]; if (a) { b(a); } else c = () => a;");

  size_t visited = 0;
  tree.walk([&](node_id id, node_id parent) {
    ++visited;
    CHECK(tree.parent(id) == parent);
  });
  CHECK(visited == tree.size());
}

TEST_CASE("parser rejects invalid scripts") {
  CHECK_THROWS_AS(parse_script("a b"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_script("if ("), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_script("try {}"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_script("let x = ;"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_script("x = (1"), jscov::syntax::syntax_error);
}

TEST_CASE("parser reports where a script stops parsing") {
  try {
    parse_script("a = 1;\nb c d;");
    FAIL("expected a syntax error");
  } catch (const jscov::syntax::syntax_error& e) {
    CHECK(e.position().line == 2);
    CHECK(e.offset() >= 7);
  }
}

TEST_CASE("parser accepts for await only inside async functions") {
  CHECK(count(parse_script("async function f() { for await (const x of s) {} }"), node_kind::for_of_statement) == 1);
  CHECK(count(parse_script("const f = async () => { for await (x of s); };"), node_kind::for_of_statement) == 1);

  CHECK_THROWS_AS(parse_script("for await (const x of s) {}"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_script("function f() { for await (const x of s) {} }"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(
      parse_script("async function f() { return () => { for await (const x of s) {} }; }"), jscov::syntax::syntax_error
  );
}

TEST_CASE("parser accepts private names only inside a class body") {
  auto tree = parse_script("class A { #a; has(o) { return #a in o; } get() { return this.#a; } }");
  CHECK(count(tree, node_kind::class_method) == 2);

  CHECK_THROWS_AS(parse_script("#a in obj;"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_script("function f(o) { return #a in o; }"), jscov::syntax::syntax_error);
  CHECK_THROWS_AS(parse_script("obj.#a;"), jscov::syntax::syntax_error);
}

TEST_CASE("node kinds separate countable statements from roots") {
  using jscov::syntax::is_countable_statement;
  using jscov::syntax::is_root;

  CHECK(is_root(node_kind::program));
  CHECK(is_root(node_kind::class_private_method));
  CHECK_FALSE(is_root(node_kind::class_body));

  CHECK(is_countable_statement(node_kind::expression_statement));
  CHECK(is_countable_statement(node_kind::export_declaration));
  CHECK_FALSE(is_countable_statement(node_kind::block_statement));
  CHECK_FALSE(is_countable_statement(node_kind::function_declaration));
  CHECK_FALSE(is_countable_statement(node_kind::directive));

  CHECK(jscov::syntax::node_kind_name(node_kind::for_of_statement) == "ForOfStatement");
}
