#include <doctest/doctest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "commands/fixture.hpp"
#include "jscov/coverage_fixtures.hpp"
#include "tool_fixtures.hpp"

namespace {

using jscov::test::function;
using jscov::test::range;
using jscov::test::script;
using jscovtool::test::scoped_temp_dir;

nlohmann::json item(const std::string& source, const std::string& type, const v8cov::script_coverage& coverage) {
  return nlohmann::json{{"sourceText", source}, {"sourceType", type}, {"scriptCov", coverage}};
}

nlohmann::json two_scripts() {
  return nlohmann::json::array({
      item(
          "function f(){1;2;}\nf();", "script",
          script(
              "file:///called.js", {function("", {range(0, 23, 1)}), function("f", {range(0, 18, 1), range(15, 17, 0)})}
          )
      ),
      item("export const x = 1;", "module", script("file:///mod.js", {function("", {range(0, 19, 1)})})),
  });
}

} // namespace

TEST_CASE("fixture converts items into a map keyed by url") {
  auto actual = jscovtool::commands::convert_fixture(two_scripts());

  REQUIRE(actual.size() == 2);
  CHECK(actual.begin().key() == "file:///called.js");

  const auto& called = actual.at("file:///called.js");
  CHECK(called.at("path") == "file:///called.js");
  CHECK(called.at("s").at("s0") == 1);
  CHECK(called.at("s").at("s1") == 0);
  CHECK(called.at("s").at("s2") == 1);
  CHECK(called.at("f").at("f0") == 1);
  CHECK(called.at("fnMap").at("f0").at("name") == "f");
  CHECK(called.at("branchMap").empty());

  CHECK(actual.at("file:///mod.js").at("s").at("s0") == 1);
}

TEST_CASE("fixture rejects malformed items") {
  CHECK_THROWS_AS(jscovtool::commands::convert_fixture(nlohmann::json::object()), std::runtime_error);

  auto unknown = nlohmann::json::array({item("x;", "typescript", script("file:///x.js", {}))});
  CHECK_THROWS_AS(jscovtool::commands::convert_fixture(unknown), std::runtime_error);
}

TEST_CASE("fixture reports urls that differ from the snapshot") {
  auto actual = jscovtool::commands::convert_fixture(two_scripts());
  CHECK(jscovtool::commands::compare_snapshot(actual, actual).empty());

  auto changed = actual;
  changed["file:///called.js"]["s"]["s1"] = 5;
  CHECK(jscovtool::commands::compare_snapshot(actual, changed) == std::vector<std::string>{"file:///called.js"});

  auto missing = actual;
  missing.erase("file:///mod.js");
  CHECK(jscovtool::commands::compare_snapshot(actual, missing) == std::vector<std::string>{"file:///mod.js"});
}

TEST_CASE("fixture updates a snapshot and then matches it") {
  scoped_temp_dir dir("snapshot");

  jscovtool::commands::fixture_options options;
  options.fixture = dir.write("fixture.json", two_scripts().dump());
  options.snapshot = dir.file("snapshot.json");

  // nothing to compare against yet
  CHECK(jscovtool::commands::fixture(options) == 1);

  options.update = true;
  REQUIRE(jscovtool::commands::fixture(options) == 0);

  options.update = false;
  CHECK(jscovtool::commands::fixture(options) == 0);
}

TEST_CASE("fixture fails when the snapshot does not match") {
  scoped_temp_dir dir("mismatch");

  auto expected = jscovtool::commands::convert_fixture(two_scripts());
  expected["file:///called.js"]["f"]["f0"] = 42;

  jscovtool::commands::fixture_options options;
  options.fixture = dir.write("fixture.json", two_scripts().dump());
  options.snapshot = dir.write("snapshot.json", expected.dump(2));

  CHECK(jscovtool::commands::fixture(options) == 1);

  jscovtool::commands::fixture_options missing_paths;
  CHECK(jscovtool::commands::fixture(missing_paths) == 1);
}
