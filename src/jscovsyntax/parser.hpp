#pragma once

#include <string>

#include "jscovsyntax/source_type.hpp"
#include "jscovsyntax/syntax_tree.hpp"

namespace jscov::syntax {

/**
 * @brief Parses source text into a finalized syntax tree.
 *
 * The text is parsed with the tree-sitter JavaScript grammar and converted into a syntax_tree.
 * Node spans follow the usual estree conventions: statements end after their `;` when one was
 * written, parenthesized expressions keep the span of the inner expression, and the program
 * spans the whole text. Grammar nodes without a dedicated kind become `node_kind::other`.
 *
 * @throws syntax_error when the text is not valid for the given source type
 */
syntax_tree parse(std::string source, source_type type);

} // namespace jscov::syntax
