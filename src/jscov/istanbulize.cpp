#include "istanbulize.hpp"

#include <utility>

#include "jscov/script_coverage.hpp"

namespace jscov {

istanbul::file_coverage istanbulize(std::string source_text, syntax::source_type type, const v8cov::script_coverage& script) {
  script_coverage coverage(std::move(source_text), type);
  coverage.add(script);
  return coverage.to_report();
}

istanbul::file_coverage fold_coverage(
    std::string source_text, syntax::source_type type, const std::vector<v8cov::script_coverage>& snapshots
) {
  script_coverage coverage(std::move(source_text), type);
  coverage.add_all(snapshots);
  return coverage.to_report();
}

istanbul::file_coverage convert_wrapped(
    std::string_view source_text, syntax::source_type type, const std::vector<v8cov::script_coverage>& snapshots,
    const std::optional<wrapper_lengths>& wrapper
) {
  if (!wrapper) {
    return fold_coverage(std::string(source_text), type, snapshots);
  }

  std::vector<v8cov::script_coverage> unwrapped;
  unwrapped.reserve(snapshots.size());
  for (const auto& snapshot : snapshots) {
    unwrapped.push_back(unwrap_script_coverage(snapshot, *wrapper));
  }
  return fold_coverage(std::string(source_text), type, unwrapped);
}

} // namespace jscov
