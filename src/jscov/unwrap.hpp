#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <jscovformats/v8cov.hpp>

namespace jscov {

// a wrapper part is either its literal text or its length in utf-16 code units
using wrapper_part = std::variant<std::string, uint32_t>;

struct wrapper {
  wrapper_part prefix;
  wrapper_part suffix;
};

struct wrapper_lengths {
  uint32_t prefix = 0;
  uint32_t suffix = 0;
};

inline constexpr std::string_view k_commonjs_prefix = "(function (exports, require, module, __filename, __dirname) { ";
inline constexpr std::string_view k_commonjs_suffix = "\n});";

// the wrapper node.js puts around CommonJS modules
wrapper commonjs_wrapper();

wrapper_lengths resolve_wrapper(const wrapper& parts);

/**
 * @brief Removes `lengths.prefix` leading and `lengths.suffix` trailing utf-16 units.
 */
std::string unwrap_source_text(std::string_view text, const wrapper_lengths& lengths);

/**
 * @brief Moves coverage of a wrapped script onto the unwrapped body.
 *
 * The body ends `lengths.suffix` units before the end of `functions[0].ranges[0]`. Ranges are
 * shifted to the body start and clamped to the body; empty ranges are dropped, as are functions
 * left without ranges. A script without functions is returned unchanged.
 *
 * @throws coverage_error with error_code::invalid_script_coverage when `functions[0]` has no ranges
 */
v8cov::script_coverage unwrap_script_coverage(const v8cov::script_coverage& script, const wrapper_lengths& lengths);

} // namespace jscov
