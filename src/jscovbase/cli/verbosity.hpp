#pragma once

#include <string>

#include <redlog.hpp>

#include "jscovbase/env_config.hpp"

namespace jscov::cli {

// 0 info, 1 verbose, 2 trace, 3 debug, 4 and above pedantic
inline redlog::level level_from_verbosity(int count) {
  switch (count <= 0 ? 0 : count) {
  case 0:
    return redlog::level::info;
  case 1:
    return redlog::level::verbose;
  case 2:
    return redlog::level::trace;
  case 3:
    return redlog::level::debug;
  default:
    return redlog::level::pedantic;
  }
}

/**
 * Verbosity for a command: the number of -v flags, or `<prefix>_VERBOSE` when no flag was given.
 */
inline int resolve_verbosity(int flag_count, const std::string& env_prefix = "JSCOV") {
  if (flag_count > 0) {
    return flag_count;
  }
  int from_env = util::env_config(env_prefix).get<int>("VERBOSE", 0);
  return from_env > 0 ? from_env : 0;
}

inline void apply_verbosity(int flag_count) { redlog::set_level(level_from_verbosity(resolve_verbosity(flag_count))); }

} // namespace jscov::cli
