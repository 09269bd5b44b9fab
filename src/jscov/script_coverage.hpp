#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include <jscovformats/istanbul.hpp>
#include <jscovformats/v8cov.hpp>
#include <redlog.hpp>

#include "jscovsyntax/source_type.hpp"
#include "jscovsyntax/syntax_tree.hpp"

namespace jscov {

struct function_entry {
  syntax::node_id root = syntax::k_invalid_node;
  uint64_t count = 0;
  std::string name; // last name reported by the engine
};

struct statement_entry {
  syntax::node_id node = syntax::k_invalid_node;
  syntax::node_id root = syntax::k_invalid_node;
  uint64_t count = 0;
};

/**
 * @brief Accumulates engine coverage of one script onto its statements and functions.
 *
 * Construction parses the source and registers every function (the program excluded) and every
 * countable statement with a count of zero, in pre-order. Each `add` matches the snapshot's
 * functions onto the script's roots and adds the resolved counts. An `add` either applies
 * completely or throws and leaves the accumulator untouched.
 *
 * Statements whose root is not matched by a snapshot keep their count; a snapshot in which a
 * function did not run carries no information about its statements.
 */
class script_coverage {
public:
  /**
   * @throws syntax::syntax_error when the source does not parse as `type`
   */
  script_coverage(std::string source_text, syntax::source_type type);
  explicit script_coverage(syntax::syntax_tree tree);

  /**
   * @throws coverage_error with error_code::count_not_found or error_code::unknown_node
   */
  void add(const v8cov::script_coverage& snapshot);

  // applies snapshots in order; stops at the first failing snapshot
  void add_all(const std::vector<v8cov::script_coverage>& snapshots);

  istanbul::file_coverage to_report() const;

  const std::string& path() const { return path_; }
  const syntax::syntax_tree& tree() const { return tree_; }
  const std::vector<syntax::node_id>& roots() const { return roots_; }
  const std::vector<function_entry>& functions() const { return functions_; }
  const std::vector<statement_entry>& statements() const { return statements_; }
  syntax::node_id root_of(syntax::node_id id) const;

  size_t function_count() const { return functions_.size(); }
  size_t statement_count() const { return statements_.size(); }
  size_t add_count() const { return add_count_; }

private:
  void index_tree();

  syntax::syntax_tree tree_;
  std::vector<syntax::node_id> root_of_;
  std::vector<syntax::node_id> roots_;
  std::vector<function_entry> functions_;
  std::unordered_map<syntax::node_id, size_t> function_index_;
  std::vector<statement_entry> statements_;
  std::string path_;
  size_t add_count_ = 0;

  redlog::logger log_ = redlog::get_logger("jscov.script");
};

} // namespace jscov
