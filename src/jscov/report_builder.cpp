#include "report_builder.hpp"

#include <string>

#include "jscov/script_coverage.hpp"

namespace jscov {

istanbul::range to_istanbul_range(const source_location& loc) {
  return istanbul::range{{loc.start.line, loc.start.column}, {loc.end.line, loc.end.column}};
}

istanbul::file_coverage build_report(const script_coverage& coverage) {
  const auto& tree = coverage.tree();

  istanbul::file_coverage report;
  report.path = coverage.path();

  report.statements.reserve(coverage.statement_count());
  size_t next_statement = 0;
  for (const auto& statement : coverage.statements()) {
    istanbul::statement_entry entry;
    entry.id = "s" + std::to_string(next_statement++);
    entry.loc = to_istanbul_range(tree.loc(statement.node));
    entry.count = statement.count;
    report.statements.push_back(std::move(entry));
  }

  report.functions.reserve(coverage.function_count());
  size_t next_function = 0;
  for (const auto& function : coverage.functions()) {
    const source_location& loc = tree.loc(function.root);

    istanbul::function_entry entry;
    entry.id = "f" + std::to_string(next_function++);
    entry.name = function.name;
    entry.decl = to_istanbul_range(loc);
    entry.loc = entry.decl;
    entry.line = loc.start.line;
    entry.count = function.count;
    report.functions.push_back(std::move(entry));
  }

  return report;
}

} // namespace jscov
