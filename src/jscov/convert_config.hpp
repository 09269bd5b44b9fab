#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "jscov/unwrap.hpp"
#include "jscovsyntax/source_type.hpp"

namespace jscov {

enum class wrapper_mode : uint8_t {
  none,
  commonjs,
};

inline constexpr const char* wrapper_mode_name(wrapper_mode mode) {
  switch (mode) {
  case wrapper_mode::commonjs:
    return "cjs";
  case wrapper_mode::none:
  default:
    return "none";
  }
}

struct convert_config {
  syntax::source_type source_type = syntax::source_type::script;
  wrapper_mode wrapper = wrapper_mode::none;
  std::optional<uint32_t> wrapper_prefix;
  std::optional<uint32_t> wrapper_suffix;
  std::string output; // empty writes to stdout
  bool pretty = false;

  static convert_config from_environment();

  // explicit prefix/suffix lengths override the ones implied by `wrapper`
  std::optional<wrapper_lengths> resolve_wrapper_lengths() const;
};

} // namespace jscov
