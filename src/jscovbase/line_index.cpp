#include "line_index.hpp"

#include <algorithm>

namespace jscov::util {

namespace {

size_t sequence_length(unsigned char lead) {
  if (lead < 0x80) {
    return 1;
  }
  if ((lead & 0xe0) == 0xc0) {
    return 2;
  }
  if ((lead & 0xf0) == 0xe0) {
    return 3;
  }
  if ((lead & 0xf8) == 0xf0) {
    return 4;
  }
  // stray continuation or invalid lead byte counts as a single unit
  return 1;
}

} // namespace

line_index::line_index(std::string_view text) { reset(text); }

void line_index::reset(std::string_view text) {
  units_.assign(text.size() + 1, 0);
  line_starts_.assign(1, 0);

  uint32_t units = 0;
  size_t i = 0;
  while (i < text.size()) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    size_t length = std::min(sequence_length(c), text.size() - i);
    for (size_t k = 0; k < length; ++k) {
      units_[i + k] = units;
    }

    bool breaks_line = false;
    if (c == '\n') {
      breaks_line = true;
    } else if (c == '\r') {
      breaks_line = i + 1 >= text.size() || text[i + 1] != '\n';
    } else if (length == 3 && c == 0xe2 && static_cast<unsigned char>(text[i + 1]) == 0x80) {
      unsigned char last = static_cast<unsigned char>(text[i + 2]);
      breaks_line = last == 0xa8 || last == 0xa9;
    }

    units += length == 4 ? 2 : 1;
    i += length;
    if (breaks_line) {
      line_starts_.push_back(i);
    }
  }
  units_[text.size()] = units;
}

size_t line_index::clamp(size_t byte_offset) const { return std::min(byte_offset, units_.size() - 1); }

uint32_t line_index::engine_offset(size_t byte_offset) const { return units_[clamp(byte_offset)]; }

source_position line_index::position(size_t byte_offset) const {
  size_t offset = clamp(byte_offset);
  auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
  size_t line = static_cast<size_t>(std::distance(line_starts_.begin(), it)) - 1;
  size_t start = line_starts_[line];

  source_position position;
  position.line = static_cast<uint32_t>(line + 1);
  position.column = units_[offset] - units_[start];
  return position;
}

size_t line_index::line_start(size_t line) const {
  if (line >= line_starts_.size()) {
    return units_.size() - 1;
  }
  return line_starts_[line];
}

} // namespace jscov::util
