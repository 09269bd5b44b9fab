#include "inspect.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <jscovformats/v8cov.hpp>
#include <redlog.hpp>

#include "jscovbase/interval.hpp"

namespace jscovtool::commands {

namespace {

struct script_summary {
  size_t functions = 0;
  size_t executed = 0;
  size_t ranges = 0;
  uint64_t calls = 0;
  size_t malformed_ranges = 0;
  uint64_t unexecuted_units = 0;
};

script_summary summarize(const v8cov::script_coverage& script) {
  script_summary summary;
  std::vector<jscov::offset_span> unexecuted;

  for (const auto& function : script.functions) {
    ++summary.functions;
    summary.ranges += function.ranges.size();
    if (function.ranges.empty()) {
      continue;
    }
    if (function.ranges.front().count > 0) {
      ++summary.executed;
    }
    summary.calls += function.ranges.front().count;
    for (const auto& range : function.ranges) {
      if (!jscov::util::span_is_valid(range.start_offset, range.end_offset)) {
        ++summary.malformed_ranges;
        continue;
      }
      if (range.count == 0) {
        unexecuted.push_back(jscov::offset_span{range.start_offset, range.end_offset});
      }
    }
  }

  jscov::util::merge_spans(unexecuted);
  for (const auto& span : unexecuted) {
    summary.unexecuted_units += jscov::util::span_size(span);
  }
  return summary;
}

void print_function(const v8cov::function_coverage& function) {
  std::cout << "  " << (function.function_name.empty() ? "(anonymous)" : function.function_name);
  if (function.ranges.empty()) {
    std::cout << " (no ranges)\n";
    return;
  }

  const auto& own = function.ranges.front();
  std::cout << " [" << own.start_offset << ", " << own.end_offset << ") count=" << own.count
            << (function.is_block_coverage ? " block" : "") << "\n";
  for (size_t i = 1; i < function.ranges.size(); ++i) {
    const auto& range = function.ranges[i];
    std::cout << "    [" << range.start_offset << ", " << range.end_offset << ") count=" << range.count << "\n";
  }
}

} // namespace

int inspect(args::ValueFlag<std::string>& coverage_flag, args::Flag& detailed_flag, args::ValueFlag<std::string>& url_flag) {
  auto log = redlog::get_logger("jscovtool.inspect");

  if (!coverage_flag) {
    log.err("coverage file path required");
    return 1;
  }

  std::string coverage_path = args::get(coverage_flag);
  std::string filter = url_flag ? args::get(url_flag) : std::string{};
  log.inf("inspecting coverage file", redlog::field("file", coverage_path));

  try {
    auto process = v8cov::read(coverage_path);

    std::cout << "=== V8 Coverage ===\n";
    std::cout << "file: " << coverage_path << "\n";
    std::cout << "scripts: " << process.result.size() << "\n\n";

    size_t shown = 0;
    for (const auto& script : process.result) {
      if (!filter.empty() && script.url.find(filter) == std::string::npos) {
        continue;
      }
      ++shown;

      auto summary = summarize(script);
      std::cout << "script " << (script.script_id.empty() ? "?" : script.script_id) << ": "
                << (script.url.empty() ? "(no url)" : script.url) << "\n";
      std::cout << "  functions: " << summary.functions << " (executed " << summary.executed << ", unexecuted "
                << summary.functions - summary.executed << ")\n";
      std::cout << "  ranges: " << summary.ranges << "\n";
      std::cout << "  calls: " << summary.calls << "\n";
      std::cout << "  unexecuted units: " << summary.unexecuted_units << "\n";
      if (summary.malformed_ranges > 0) {
        log.wrn(
            "script has ranges ending before they start", redlog::field("url", script.url),
            redlog::field("ranges", summary.malformed_ranges)
        );
      }

      if (detailed_flag) {
        for (const auto& function : script.functions) {
          print_function(function);
        }
      }
      std::cout << "\n";
    }

    if (!filter.empty() && shown == 0) {
      log.wrn("no scripts match filter", redlog::field("filter", filter));
    }
  } catch (const std::exception& e) {
    log.err("failed to read coverage file", redlog::field("file", coverage_path), redlog::field("error", e.what()));
    return 1;
  }

  return 0;
}

} // namespace jscovtool::commands
