#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>

#include <jscovformats/v8cov.hpp>

#include "jscovsyntax/syntax_tree.hpp"

namespace jscov {

// root id -> index into the engine function list
using function_matches = std::unordered_map<syntax::node_id, size_t>;

/**
 * @brief Pairs syntactic roots with engine functions whose own span is exactly the root's span.
 *
 * Roots are taken in the given order. For each root the still unmatched functions are scanned
 * from last to first and the first exact match is consumed, so every function is matched at most
 * once. Functions without ranges never match; unmatched roots are absent from the result and
 * unmatched functions are dropped.
 */
function_matches match_functions(
    const syntax::syntax_tree& tree, const std::vector<syntax::node_id>& roots,
    const std::vector<v8cov::function_coverage>& functions
);

} // namespace jscov
