#include "function_matcher.hpp"

#include <iterator>

#include <redlog.hpp>

#include "jscovbase/interval.hpp"

namespace jscov {

function_matches match_functions(
    const syntax::syntax_tree& tree, const std::vector<syntax::node_id>& roots,
    const std::vector<v8cov::function_coverage>& functions
) {
  auto log = redlog::get_logger("jscov.matcher");

  std::vector<size_t> remaining;
  remaining.reserve(functions.size());
  for (size_t i = 0; i < functions.size(); ++i) {
    if (!functions[i].ranges.empty()) {
      remaining.push_back(i);
    }
  }

  function_matches matches;
  for (syntax::node_id root : roots) {
    const offset_span& span = tree.span(root);

    for (auto it = remaining.rbegin(); it != remaining.rend(); ++it) {
      const auto& own = functions[*it].ranges.front();
      if (!util::span_equals(offset_span{own.start_offset, own.end_offset}, span)) {
        continue;
      }
      matches.emplace(root, *it);
      remaining.erase(std::next(it).base());
      break;
    }
  }

  for (size_t index : remaining) {
    const auto& own = functions[index].ranges.front();
    log.dbg(
        "discarding unmatched engine function", redlog::field("name", functions[index].function_name),
        redlog::field("start", own.start_offset), redlog::field("end", own.end_offset)
    );
  }

  log.trc(
      "matched functions", redlog::field("roots", roots.size()), redlog::field("functions", functions.size()),
      redlog::field("matched", matches.size())
  );
  return matches;
}

} // namespace jscov
