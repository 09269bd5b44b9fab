#include "range_matcher.hpp"

#include <string>

#include "jscov/error.hpp"
#include "jscovbase/interval.hpp"

namespace jscov {

uint64_t match_count(const std::vector<v8cov::range_coverage>& ranges, const offset_span& span) {
  for (auto it = ranges.rbegin(); it != ranges.rend(); ++it) {
    if (util::span_encloses(it->start_offset, it->end_offset, span.start, span.end)) {
      return it->count;
    }
  }

  throw coverage_error(
      error_code::count_not_found,
      "no coverage range encloses [" + std::to_string(span.start) + ", " + std::to_string(span.end) + ")"
  );
}

} // namespace jscov
