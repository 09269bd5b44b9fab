#pragma once

#include <algorithm>
#include <cstdint>
#include <vector>

#include "jscovbase/types.hpp"

namespace jscov::util {

constexpr bool span_is_valid(uint32_t start, uint32_t end) { return start <= end; }

constexpr uint32_t span_size(uint32_t start, uint32_t end) { return end > start ? end - start : 0; }

// outer encloses inner when outer.start <= inner.start and inner.end <= outer.end
constexpr bool span_encloses(uint32_t outer_start, uint32_t outer_end, uint32_t inner_start, uint32_t inner_end) {
  return outer_start <= inner_start && inner_end <= outer_end;
}

constexpr bool span_encloses(const offset_span& outer, const offset_span& inner) {
  return span_encloses(outer.start, outer.end, inner.start, inner.end);
}

constexpr bool span_equals(const offset_span& left, const offset_span& right) {
  return left.start == right.start && left.end == right.end;
}

constexpr uint32_t span_size(const offset_span& span) { return span_size(span.start, span.end); }

// shifts a span left by `base` and clamps it to [0, limit]; returns false when nothing remains
inline bool rebase_span(int64_t start, int64_t end, int64_t base, int64_t limit, offset_span& out) {
  int64_t rebased_start = std::max<int64_t>(start - base, 0);
  int64_t rebased_end = std::min<int64_t>(end - base, limit);
  if (rebased_start >= rebased_end) {
    return false;
  }
  out.start = static_cast<uint32_t>(rebased_start);
  out.end = static_cast<uint32_t>(rebased_end);
  return true;
}

inline void merge_spans(std::vector<offset_span>& spans) {
  if (spans.empty()) {
    return;
  }

  std::sort(spans.begin(), spans.end(), [](const auto& left, const auto& right) { return left.start < right.start; });

  std::vector<offset_span> merged;
  merged.reserve(spans.size());
  offset_span current = spans.front();

  for (size_t i = 1; i < spans.size(); ++i) {
    const auto& next = spans[i];
    if (next.start > current.end) {
      merged.push_back(current);
      current = next;
      continue;
    }
    current.end = std::max(current.end, next.end);
  }

  merged.push_back(current);
  spans.swap(merged);
}

} // namespace jscov::util
