#pragma once

#include <cstdint>

namespace jscov {

// half-open span of engine offsets (utf-16 code units)
struct offset_span {
  uint32_t start = 0;
  uint32_t end = 0;
};

// 1-based line, 0-based column
struct source_position {
  uint32_t line = 0;
  uint32_t column = 0;
};

struct source_location {
  source_position start{};
  source_position end{};
};

inline bool operator==(const offset_span& left, const offset_span& right) {
  return left.start == right.start && left.end == right.end;
}

inline bool operator==(const source_position& left, const source_position& right) {
  return left.line == right.line && left.column == right.column;
}

inline bool operator==(const source_location& left, const source_location& right) {
  return left.start == right.start && left.end == right.end;
}

} // namespace jscov
