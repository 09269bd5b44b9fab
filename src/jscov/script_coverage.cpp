#include "script_coverage.hpp"

#include <string>
#include <utility>

#include "jscov/error.hpp"
#include "jscov/function_matcher.hpp"
#include "jscov/range_matcher.hpp"
#include "jscov/report_builder.hpp"
#include "jscovsyntax/node_kind.hpp"
#include "jscovsyntax/parser.hpp"

namespace jscov {

script_coverage::script_coverage(std::string source_text, syntax::source_type type)
    : tree_(syntax::parse(std::move(source_text), type)) {
  index_tree();
}

script_coverage::script_coverage(syntax::syntax_tree tree) : tree_(std::move(tree)) { index_tree(); }

void script_coverage::index_tree() {
  root_of_.assign(tree_.size(), syntax::k_invalid_node);

  tree_.walk([this](syntax::node_id id, syntax::node_id parent) {
    syntax::node_kind kind = tree_.kind(id);

    syntax::node_id root = parent == syntax::k_invalid_node ? syntax::k_invalid_node : root_of_[parent];
    if (syntax::is_root(kind)) {
      root = id;
      roots_.push_back(id);
      if (kind != syntax::node_kind::program) {
        function_index_.emplace(id, functions_.size());
        functions_.push_back(function_entry{id, 0, {}});
      }
    }
    root_of_[id] = root;

    if (syntax::is_countable_statement(kind) && root != syntax::k_invalid_node) {
      statements_.push_back(statement_entry{id, root, 0});
    }
  });

  log_.dbg(
      "indexed script", redlog::field("nodes", tree_.size()), redlog::field("roots", roots_.size()),
      redlog::field("functions", functions_.size()), redlog::field("statements", statements_.size())
  );
}

syntax::node_id script_coverage::root_of(syntax::node_id id) const {
  return id < root_of_.size() ? root_of_[id] : syntax::k_invalid_node;
}

void script_coverage::add(const v8cov::script_coverage& snapshot) {
  const auto& functions = snapshot.functions;
  function_matches matches = match_functions(tree_, roots_, functions);

  // stage everything first so a failure leaves the accumulated state untouched
  struct function_delta {
    size_t index;
    uint64_t count;
    const std::string* name;
  };
  std::vector<function_delta> function_deltas;
  function_deltas.reserve(matches.size());

  for (syntax::node_id root : roots_) {
    auto match = matches.find(root);
    if (match == matches.end() || tree_.kind(root) == syntax::node_kind::program) {
      continue;
    }

    auto registered = function_index_.find(root);
    if (registered == function_index_.end()) {
      throw coverage_error(
          error_code::unknown_node, "matched root " + std::to_string(root) + " is not a registered function"
      );
    }

    const auto& function = functions[match->second];
    function_deltas.push_back(function_delta{registered->second, function.ranges.front().count, &function.function_name});
  }

  std::vector<std::pair<size_t, uint64_t>> statement_deltas;
  statement_deltas.reserve(statements_.size());
  for (size_t i = 0; i < statements_.size(); ++i) {
    auto match = matches.find(statements_[i].root);
    if (match == matches.end()) {
      continue;
    }
    uint64_t count = match_count(functions[match->second].ranges, tree_.span(statements_[i].node));
    statement_deltas.emplace_back(i, count);
  }

  for (const auto& delta : function_deltas) {
    functions_[delta.index].count += delta.count;
    functions_[delta.index].name = *delta.name;
  }
  for (const auto& [index, count] : statement_deltas) {
    statements_[index].count += count;
  }
  path_ = snapshot.url;
  ++add_count_;

  log_.trc(
      "added snapshot", redlog::field("url", snapshot.url), redlog::field("matched_roots", matches.size()),
      redlog::field("functions", function_deltas.size()), redlog::field("statements", statement_deltas.size())
  );
}

void script_coverage::add_all(const std::vector<v8cov::script_coverage>& snapshots) {
  for (const auto& snapshot : snapshots) {
    add(snapshot);
  }
}

istanbul::file_coverage script_coverage::to_report() const { return build_report(*this); }

} // namespace jscov
