#pragma once

#include <string>
#include <vector>

#include <args.hxx>
#include <nlohmann/json.hpp>

namespace jscovtool::commands {

struct fixture_options {
  std::string fixture;
  std::string snapshot;
  bool update = false; // write the snapshot instead of comparing
};

/**
 * Converts every `{sourceText, sourceType, scriptCov}` item into a map from script url to
 * istanbul file coverage, in fixture order.
 *
 * @throws std::runtime_error when the fixture is not an array or names an unknown source type
 */
nlohmann::ordered_json convert_fixture(const nlohmann::json& items);

// urls of `actual` whose coverage is missing from or different in `expected`
std::vector<std::string> compare_snapshot(const nlohmann::ordered_json& actual, const nlohmann::ordered_json& expected);

/**
 * fixture command - converts every item of a coverage fixture and checks it against a snapshot
 *
 * @return exit code (0 for success, 1 for failure or mismatch)
 */
int fixture(const fixture_options& options);

int fixture(args::ValueFlag<std::string>& fixture_flag, args::ValueFlag<std::string>& snapshot_flag, args::Flag& update_flag);

} // namespace jscovtool::commands
