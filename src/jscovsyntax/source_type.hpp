#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace jscov::syntax {

// controls whether top-level import/export and module-level await are accepted
enum class source_type : uint8_t {
  script,
  module,
};

inline constexpr const char* source_type_name(source_type type) {
  return type == source_type::module ? "module" : "script";
}

inline std::optional<source_type> parse_source_type(std::string_view name) {
  if (name == "script") {
    return source_type::script;
  }
  if (name == "module") {
    return source_type::module;
  }
  return std::nullopt;
}

} // namespace jscov::syntax
