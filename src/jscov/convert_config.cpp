#include "convert_config.hpp"

#include "jscovbase/env_config.hpp"

namespace jscov {

convert_config convert_config::from_environment() {
  util::env_config loader("JSCOV");

  convert_config config;
  config.source_type = loader.get_enum<syntax::source_type>(
      {
          {"script", syntax::source_type::script},
          {"module", syntax::source_type::module},
          {"esm", syntax::source_type::module},
      },
      "SOURCE_TYPE", config.source_type
  );
  config.wrapper = loader.get_enum<wrapper_mode>(
      {
          {"none", wrapper_mode::none},
          {"cjs", wrapper_mode::commonjs},
          {"commonjs", wrapper_mode::commonjs},
      },
      "WRAPPER", config.wrapper
  );
  if (loader.has("WRAPPER_PREFIX")) {
    config.wrapper_prefix = loader.get<uint32_t>("WRAPPER_PREFIX", 0);
  }
  if (loader.has("WRAPPER_SUFFIX")) {
    config.wrapper_suffix = loader.get<uint32_t>("WRAPPER_SUFFIX", 0);
  }
  config.output = loader.get<std::string>("OUTPUT", "");
  config.pretty = loader.get<bool>("PRETTY", false);
  return config;
}

std::optional<wrapper_lengths> convert_config::resolve_wrapper_lengths() const {
  if (wrapper == wrapper_mode::none && !wrapper_prefix && !wrapper_suffix) {
    return std::nullopt;
  }

  wrapper_lengths lengths{};
  if (wrapper == wrapper_mode::commonjs) {
    lengths = resolve_wrapper(commonjs_wrapper());
  }
  if (wrapper_prefix) {
    lengths.prefix = *wrapper_prefix;
  }
  if (wrapper_suffix) {
    lengths.suffix = *wrapper_suffix;
  }
  return lengths;
}

} // namespace jscov
