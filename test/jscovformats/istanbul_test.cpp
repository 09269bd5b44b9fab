#include <doctest/doctest.h>

#include <sstream>
#include <string>

#include <jscovformats/istanbul.hpp>

namespace {

istanbul::file_coverage sample_file() {
  istanbul::file_coverage file;
  file.path = "file:///app/main.js";
  file.statements.push_back({"s0", {{1, 13}, {1, 15}}, 3});
  file.statements.push_back({"s1", {{1, 15}, {1, 17}}, 0});
  file.functions.push_back({"f0", "f", {{1, 0}, {1, 18}}, {{1, 0}, {1, 18}}, 1, 3});
  return file;
}

} // namespace

TEST_CASE("istanbul writes file coverage with stable key order") {
  nlohmann::ordered_json json = sample_file();

  std::vector<std::string> keys;
  for (auto it = json.begin(); it != json.end(); ++it) {
    keys.push_back(it.key());
  }
  CHECK(keys == std::vector<std::string>{"path", "statementMap", "s", "fnMap", "f", "branchMap", "b"});

  CHECK(json["statementMap"]["s0"]["start"]["column"] == 13);
  CHECK(json["s"]["s1"] == 0);
  CHECK(json["fnMap"]["f0"]["name"] == "f");
  CHECK(json["fnMap"]["f0"]["line"] == 1);
  CHECK(json["fnMap"]["f0"]["decl"] == json["fnMap"]["f0"]["loc"]);
  CHECK(json["f"]["f0"] == 3);
  CHECK(json["branchMap"].is_object());
  CHECK(json["branchMap"].empty());
  CHECK(json["b"].empty());
}

TEST_CASE("istanbul keys a coverage map by path") {
  auto other = sample_file();
  other.path = "file:///app/other.js";

  auto document = istanbul::to_document(istanbul::coverage_map{sample_file(), other});
  REQUIRE(document.size() == 2);
  CHECK(document.begin().key() == "file:///app/main.js");
  CHECK(document["file:///app/other.js"]["path"] == "file:///app/other.js");
}

TEST_CASE("istanbul reads back what it writes") {
  std::stringstream out;
  istanbul::write(out, istanbul::coverage_map{sample_file()}, 2);

  auto map = istanbul::parse(out.str());
  REQUIRE(map.size() == 1);
  CHECK(map[0] == sample_file());
}

TEST_CASE("istanbul reports malformed coverage maps") {
  CHECK_THROWS_AS(istanbul::parse("[1, 2]"), istanbul::format_error);
  CHECK_THROWS_AS(istanbul::parse(R"({"x": {"path": "x"}})"), istanbul::format_error);
  CHECK_THROWS_AS(istanbul::parse("{"), istanbul::format_error);
}
