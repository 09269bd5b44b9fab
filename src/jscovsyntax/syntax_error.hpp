#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "jscovbase/types.hpp"

namespace jscov::syntax {

/**
 * @brief Thrown when source text cannot be parsed.
 *
 * Carries the byte offset of the offending token and its line/column position.
 */
class syntax_error : public std::runtime_error {
public:
  syntax_error(const std::string& message, uint32_t offset, source_position position)
      : std::runtime_error(
            message + " (" + std::to_string(position.line) + ":" + std::to_string(position.column) + ")"
        ),
        reason_(message), offset_(offset), position_(position) {}

  const std::string& reason() const noexcept { return reason_; }
  uint32_t offset() const noexcept { return offset_; }
  source_position position() const noexcept { return position_; }

private:
  std::string reason_;
  uint32_t offset_ = 0;
  source_position position_{};
};

} // namespace jscov::syntax
