#include "fixture.hpp"

#include <fstream>
#include <stdexcept>

#include <jscovformats/istanbul.hpp>
#include <jscovformats/v8cov.hpp>
#include <redlog.hpp>

#include "io.hpp"
#include "jscov/istanbulize.hpp"

namespace jscovtool::commands {

nlohmann::ordered_json convert_fixture(const nlohmann::json& items) {
  auto log = redlog::get_logger("jscovtool.fixture");

  if (!items.is_array()) {
    throw std::runtime_error("fixture must be an array");
  }

  nlohmann::ordered_json actual = nlohmann::ordered_json::object();
  for (const auto& item : items) {
    std::string type_name = item.at("sourceType").get<std::string>();
    auto type = jscov::syntax::parse_source_type(type_name);
    if (!type) {
      throw std::runtime_error("unknown source type: " + type_name);
    }

    auto script = item.at("scriptCov").get<v8cov::script_coverage>();
    auto report = jscov::istanbulize(item.at("sourceText").get<std::string>(), *type, script);
    log.dbg("converted fixture item", redlog::field("url", script.url), redlog::field("statements", report.statements.size()));
    actual[script.url] = report;
  }
  return actual;
}

std::vector<std::string> compare_snapshot(const nlohmann::ordered_json& actual, const nlohmann::ordered_json& expected) {
  std::vector<std::string> mismatches;
  for (auto it = actual.begin(); it != actual.end(); ++it) {
    auto found = expected.find(it.key());
    if (found == expected.end() || *found != it.value()) {
      mismatches.push_back(it.key());
    }
  }
  return mismatches;
}

int fixture(const fixture_options& options) {
  auto log = redlog::get_logger("jscovtool.fixture");

  if (options.fixture.empty() || options.snapshot.empty()) {
    log.err("fixture and snapshot paths required");
    return 1;
  }

  try {
    auto items = nlohmann::json::parse(read_text_file(options.fixture));
    auto actual = convert_fixture(items);

    if (options.update) {
      std::ofstream out(options.snapshot, std::ios::binary);
      if (!out.is_open()) {
        log.err("cannot create snapshot", redlog::field("path", options.snapshot));
        return 1;
      }
      out << actual.dump(2) << "\n";
      log.inf("updated snapshot", redlog::field("path", options.snapshot), redlog::field("scripts", actual.size()));
      return 0;
    }

    auto expected = nlohmann::ordered_json::parse(read_text_file(options.snapshot));
    auto mismatches = compare_snapshot(actual, expected);
    for (const auto& url : mismatches) {
      log.err("coverage does not match snapshot", redlog::field("url", url));
    }

    if (!mismatches.empty()) {
      log.err(
          "fixture check failed", redlog::field("mismatches", mismatches.size()), redlog::field("scripts", actual.size())
      );
      return 1;
    }
    log.inf("fixture matches snapshot", redlog::field("scripts", actual.size()));
  } catch (const std::exception& e) {
    log.err("fixture check failed", redlog::field("fixture", options.fixture), redlog::field("error", e.what()));
    return 1;
  }

  return 0;
}

int fixture(args::ValueFlag<std::string>& fixture_flag, args::ValueFlag<std::string>& snapshot_flag, args::Flag& update_flag) {
  fixture_options options;
  if (fixture_flag) {
    options.fixture = args::get(fixture_flag);
  }
  if (snapshot_flag) {
    options.snapshot = args::get(snapshot_flag);
  }
  options.update = args::get(update_flag);
  return fixture(options);
}

} // namespace jscovtool::commands
