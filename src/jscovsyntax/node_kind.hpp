#pragma once

#include <cstdint>
#include <string_view>

namespace jscov::syntax {

enum class node_kind : uint8_t {
  invalid,

  // any grammar node without a dedicated kind; its grammar type is kept on the node
  other,

  program,
  directive,

  // statements
  block_statement,
  empty_statement,
  expression_statement,
  variable_declaration,
  if_statement,
  for_statement,
  for_in_statement,
  for_of_statement,
  while_statement,
  do_while_statement,
  return_statement,
  break_statement,
  continue_statement,
  throw_statement,
  try_statement,
  switch_statement,
  labeled_statement,
  debugger_statement,
  with_statement,
  function_declaration,
  class_declaration,
  import_declaration,
  export_declaration,

  // functions
  function_expression,
  arrow_function_expression,
  object_method,
  class_method,
  class_private_method,

  // statement and class parts
  variable_declarator,
  switch_case,
  catch_clause,
  class_expression,
  class_body,
  class_property,
  static_block,
};

std::string_view node_kind_name(node_kind kind);

bool is_function(node_kind kind);

// program or function
bool is_root(node_kind kind);

bool is_statement(node_kind kind);

// statements that get a counter: every statement except blocks and function declarations
bool is_countable_statement(node_kind kind);

} // namespace jscov::syntax
