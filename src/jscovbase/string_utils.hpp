#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace jscov::util {

inline std::string to_lower(std::string_view value) {
  std::string out(value.begin(), value.end());
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

inline std::string_view trim_view(std::string_view value) {
  size_t first = value.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return std::string_view{};
  }
  size_t last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

inline std::string trim_copy(std::string_view value) {
  std::string_view trimmed = trim_view(value);
  return std::string(trimmed.begin(), trimmed.end());
}

inline bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

// number of utf-16 code units needed to encode a utf-8 string
inline size_t utf16_length(std::string_view utf8) {
  size_t units = 0;
  for (unsigned char c : utf8) {
    if ((c & 0xc0) == 0x80) {
      continue;
    }
    units += (c >= 0xf0) ? 2 : 1;
  }
  return units;
}

// byte offset of the utf-16 unit index `units` inside a utf-8 string, clamped to its size
inline size_t utf8_offset_of_utf16(std::string_view utf8, size_t units) {
  size_t seen = 0;
  for (size_t i = 0; i < utf8.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(utf8[i]);
    if ((c & 0xc0) == 0x80) {
      continue;
    }
    if (seen >= units) {
      return i;
    }
    seen += (c >= 0xf0) ? 2 : 1;
  }
  return utf8.size();
}

} // namespace jscov::util
