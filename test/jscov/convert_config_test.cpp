#include <doctest/doctest.h>

#include <cstdlib>
#include <string>

#include "jscov/convert_config.hpp"

namespace {

struct scoped_env {
  scoped_env(const char* name, const char* value) : name_(name) { setenv(name, value, 1); }
  ~scoped_env() { unsetenv(name_); }

  const char* name_;
};

} // namespace

TEST_CASE("convert_config defaults") {
  auto config = jscov::convert_config::from_environment();
  CHECK(config.source_type == jscov::syntax::source_type::script);
  CHECK(config.wrapper == jscov::wrapper_mode::none);
  CHECK_FALSE(config.wrapper_prefix.has_value());
  CHECK(config.output.empty());
  CHECK_FALSE(config.pretty);
  CHECK_FALSE(config.resolve_wrapper_lengths().has_value());
}

TEST_CASE("convert_config reads the environment") {
  scoped_env type("JSCOV_SOURCE_TYPE", "esm");
  scoped_env wrapper("JSCOV_WRAPPER", "CJS");
  scoped_env output("JSCOV_OUTPUT", "coverage/out.json");
  scoped_env pretty("JSCOV_PRETTY", "1");

  auto config = jscov::convert_config::from_environment();
  CHECK(config.source_type == jscov::syntax::source_type::module);
  CHECK(config.wrapper == jscov::wrapper_mode::commonjs);
  CHECK(config.output == "coverage/out.json");
  CHECK(config.pretty);

  auto lengths = config.resolve_wrapper_lengths();
  REQUIRE(lengths.has_value());
  CHECK(lengths->prefix == 62);
  CHECK(lengths->suffix == 4);
}

TEST_CASE("convert_config explicit lengths override the wrapper") {
  jscov::convert_config config;
  config.wrapper = jscov::wrapper_mode::commonjs;
  config.wrapper_suffix = 0;

  auto lengths = config.resolve_wrapper_lengths();
  REQUIRE(lengths.has_value());
  CHECK(lengths->prefix == 62);
  CHECK(lengths->suffix == 0);

  jscov::convert_config custom;
  custom.wrapper_prefix = 10;
  lengths = custom.resolve_wrapper_lengths();
  REQUIRE(lengths.has_value());
  CHECK(lengths->prefix == 10);
  CHECK(lengths->suffix == 0);
}

TEST_CASE("convert_config reads explicit lengths from the environment") {
  scoped_env prefix("JSCOV_WRAPPER_PREFIX", "12");

  auto config = jscov::convert_config::from_environment();
  REQUIRE(config.wrapper_prefix.has_value());
  CHECK(*config.wrapper_prefix == 12);
  CHECK_FALSE(config.wrapper_suffix.has_value());
}

TEST_CASE("wrapper_mode_name") {
  CHECK(std::string(jscov::wrapper_mode_name(jscov::wrapper_mode::none)) == "none");
  CHECK(std::string(jscov::wrapper_mode_name(jscov::wrapper_mode::commonjs)) == "cjs");
}
