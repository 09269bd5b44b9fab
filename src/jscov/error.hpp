#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace jscov {

enum class error_code {
  count_not_found,         // no engine range encloses a statement of a matched root
  unknown_node,            // a matched root was never registered as a function
  invalid_script_coverage, // script coverage lacks the ranges an operation requires
};

inline constexpr std::string_view error_code_name(error_code code) {
  switch (code) {
  case error_code::count_not_found:
    return "count_not_found";
  case error_code::unknown_node:
    return "unknown_node";
  case error_code::invalid_script_coverage:
    return "invalid_script_coverage";
  }
  return "unknown";
}

/**
 * @brief Mismatch between a parsed script and the coverage supplied for it.
 */
class coverage_error : public std::runtime_error {
public:
  coverage_error(error_code code, const std::string& message) : std::runtime_error(message), code_(code) {}

  error_code code() const noexcept { return code_; }

private:
  error_code code_;
};

} // namespace jscov
