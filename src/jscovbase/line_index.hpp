#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "jscovbase/types.hpp"

namespace jscov::util {

/**
 * @brief Maps byte offsets of a utf-8 source to engine offsets and line/column positions.
 *
 * Engine offsets and columns are counted in utf-16 code units. Lines break at `\n`, `\r\n`, `\r`,
 * U+2028 and U+2029. The index does not keep a reference to the text.
 */
class line_index {
public:
  line_index() = default;
  explicit line_index(std::string_view text);

  void reset(std::string_view text);

  // byte offsets past the end are clamped to the text size
  uint32_t engine_offset(size_t byte_offset) const;
  source_position position(size_t byte_offset) const;

  size_t line_count() const { return line_starts_.size(); }
  size_t line_start(size_t line) const;
  uint32_t engine_length() const { return units_.empty() ? 0 : units_.back(); }
  size_t byte_length() const { return units_.empty() ? 0 : units_.size() - 1; }

private:
  size_t clamp(size_t byte_offset) const;

  // units_[i] is the utf-16 offset of byte i; units_[size] is the total length
  std::vector<uint32_t> units_{0};
  std::vector<size_t> line_starts_{0};
};

} // namespace jscov::util
