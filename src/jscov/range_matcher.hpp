#pragma once

#include <cstdint>
#include <vector>

#include <jscovformats/v8cov.hpp>

#include "jscovbase/types.hpp"

namespace jscov {

/**
 * @brief Count of the innermost engine range enclosing `span`.
 *
 * Ranges are scanned from last to first; the engine lists nested ranges after the ranges that
 * contain them, so the first enclosing range found is the innermost one.
 *
 * @throws coverage_error with error_code::count_not_found when no range encloses the span
 */
uint64_t match_count(const std::vector<v8cov::range_coverage>& ranges, const offset_span& span);

} // namespace jscov
