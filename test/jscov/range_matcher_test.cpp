#include <doctest/doctest.h>

#include "coverage_fixtures.hpp"
#include "jscov/error.hpp"
#include "jscov/range_matcher.hpp"

using jscov::test::range;

TEST_CASE("match_count prefers the innermost range") {
  std::vector<v8cov::range_coverage> ranges{range(0, 100, 1), range(10, 20, 5)};

  CHECK(jscov::match_count(ranges, {12, 15}) == 5);
  CHECK(jscov::match_count(ranges, {10, 20}) == 5);
  CHECK(jscov::match_count(ranges, {5, 15}) == 1);
  CHECK(jscov::match_count(ranges, {0, 100}) == 1);
}

TEST_CASE("match_count takes the last of identical ranges") {
  std::vector<v8cov::range_coverage> ranges{range(0, 10, 1), range(0, 10, 2)};
  CHECK(jscov::match_count(ranges, {2, 4}) == 2);
}

TEST_CASE("match_count fails when nothing encloses the span") {
  std::vector<v8cov::range_coverage> ranges{range(0, 10, 1)};

  try {
    jscov::match_count(ranges, {5, 11});
    FAIL("expected coverage_error");
  } catch (const jscov::coverage_error& e) {
    CHECK(e.code() == jscov::error_code::count_not_found);
  }

  CHECK_THROWS_AS(jscov::match_count({}, {0, 1}), jscov::coverage_error);
}
