#pragma once

#include <jscovformats/istanbul.hpp>

#include "jscovbase/types.hpp"

namespace jscov {

class script_coverage;

istanbul::range to_istanbul_range(const source_location& loc);

/**
 * @brief Renders the accumulated counts as Istanbul file coverage.
 *
 * Statements get ids `s0, s1, ...` and functions `f0, f1, ...` in registration order. Function
 * names are the last ones reported by the engine, or empty when never matched. Branch maps are
 * left empty.
 */
istanbul::file_coverage build_report(const script_coverage& coverage);

} // namespace jscov
