#include "node_kind.hpp"

namespace jscov::syntax {

std::string_view node_kind_name(node_kind kind) {
  switch (kind) {
  case node_kind::invalid:
    return "Invalid";
  case node_kind::other:
    return "Other";
  case node_kind::program:
    return "Program";
  case node_kind::directive:
    return "Directive";
  case node_kind::block_statement:
    return "BlockStatement";
  case node_kind::empty_statement:
    return "EmptyStatement";
  case node_kind::expression_statement:
    return "ExpressionStatement";
  case node_kind::variable_declaration:
    return "VariableDeclaration";
  case node_kind::if_statement:
    return "IfStatement";
  case node_kind::for_statement:
    return "ForStatement";
  case node_kind::for_in_statement:
    return "ForInStatement";
  case node_kind::for_of_statement:
    return "ForOfStatement";
  case node_kind::while_statement:
    return "WhileStatement";
  case node_kind::do_while_statement:
    return "DoWhileStatement";
  case node_kind::return_statement:
    return "ReturnStatement";
  case node_kind::break_statement:
    return "BreakStatement";
  case node_kind::continue_statement:
    return "ContinueStatement";
  case node_kind::throw_statement:
    return "ThrowStatement";
  case node_kind::try_statement:
    return "TryStatement";
  case node_kind::switch_statement:
    return "SwitchStatement";
  case node_kind::labeled_statement:
    return "LabeledStatement";
  case node_kind::debugger_statement:
    return "DebuggerStatement";
  case node_kind::with_statement:
    return "WithStatement";
  case node_kind::function_declaration:
    return "FunctionDeclaration";
  case node_kind::class_declaration:
    return "ClassDeclaration";
  case node_kind::import_declaration:
    return "ImportDeclaration";
  case node_kind::export_declaration:
    return "ExportDeclaration";
  case node_kind::function_expression:
    return "FunctionExpression";
  case node_kind::arrow_function_expression:
    return "ArrowFunctionExpression";
  case node_kind::object_method:
    return "ObjectMethod";
  case node_kind::class_method:
    return "ClassMethod";
  case node_kind::class_private_method:
    return "ClassPrivateMethod";
  case node_kind::variable_declarator:
    return "VariableDeclarator";
  case node_kind::switch_case:
    return "SwitchCase";
  case node_kind::catch_clause:
    return "CatchClause";
  case node_kind::class_expression:
    return "ClassExpression";
  case node_kind::class_body:
    return "ClassBody";
  case node_kind::class_property:
    return "ClassProperty";
  case node_kind::static_block:
    return "StaticBlock";
  }
  return "Unknown";
}

bool is_function(node_kind kind) {
  switch (kind) {
  case node_kind::function_declaration:
  case node_kind::function_expression:
  case node_kind::arrow_function_expression:
  case node_kind::object_method:
  case node_kind::class_method:
  case node_kind::class_private_method:
    return true;
  default:
    return false;
  }
}

bool is_root(node_kind kind) { return kind == node_kind::program || is_function(kind); }

bool is_statement(node_kind kind) {
  switch (kind) {
  case node_kind::block_statement:
  case node_kind::empty_statement:
  case node_kind::expression_statement:
  case node_kind::variable_declaration:
  case node_kind::if_statement:
  case node_kind::for_statement:
  case node_kind::for_in_statement:
  case node_kind::for_of_statement:
  case node_kind::while_statement:
  case node_kind::do_while_statement:
  case node_kind::return_statement:
  case node_kind::break_statement:
  case node_kind::continue_statement:
  case node_kind::throw_statement:
  case node_kind::try_statement:
  case node_kind::switch_statement:
  case node_kind::labeled_statement:
  case node_kind::debugger_statement:
  case node_kind::with_statement:
  case node_kind::function_declaration:
  case node_kind::class_declaration:
  case node_kind::import_declaration:
  case node_kind::export_declaration:
    return true;
  default:
    return false;
  }
}

bool is_countable_statement(node_kind kind) {
  return is_statement(kind) && kind != node_kind::block_statement && kind != node_kind::function_declaration;
}

} // namespace jscov::syntax
