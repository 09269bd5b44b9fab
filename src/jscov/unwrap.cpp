#include "unwrap.hpp"

#include <algorithm>
#include <utility>

#include "jscov/error.hpp"
#include "jscovbase/interval.hpp"
#include "jscovbase/string_utils.hpp"

namespace jscov {

namespace {

uint32_t part_length(const wrapper_part& part) {
  if (const auto* text = std::get_if<std::string>(&part)) {
    return static_cast<uint32_t>(util::utf16_length(*text));
  }
  return std::get<uint32_t>(part);
}

} // namespace

wrapper commonjs_wrapper() { return wrapper{std::string(k_commonjs_prefix), std::string(k_commonjs_suffix)}; }

wrapper_lengths resolve_wrapper(const wrapper& parts) {
  return wrapper_lengths{part_length(parts.prefix), part_length(parts.suffix)};
}

std::string unwrap_source_text(std::string_view text, const wrapper_lengths& lengths) {
  size_t total = util::utf16_length(text);
  if (static_cast<size_t>(lengths.prefix) + lengths.suffix >= total) {
    return std::string{};
  }

  size_t begin = util::utf8_offset_of_utf16(text, lengths.prefix);
  size_t end = util::utf8_offset_of_utf16(text, total - lengths.suffix);
  return std::string(text.substr(begin, end - begin));
}

v8cov::script_coverage unwrap_script_coverage(const v8cov::script_coverage& script, const wrapper_lengths& lengths) {
  if (script.functions.empty()) {
    return script;
  }

  const auto& root = script.functions.front();
  if (root.ranges.empty()) {
    throw coverage_error(error_code::invalid_script_coverage, "script coverage root function has no ranges");
  }

  int64_t body_start = lengths.prefix;
  int64_t body_end = static_cast<int64_t>(root.ranges.front().end_offset) - lengths.suffix;
  int64_t body_length = std::max<int64_t>(body_end - body_start, 0);

  v8cov::script_coverage unwrapped;
  unwrapped.script_id = script.script_id;
  unwrapped.url = script.url;

  for (const auto& function : script.functions) {
    v8cov::function_coverage moved;
    moved.function_name = function.function_name;
    moved.is_block_coverage = function.is_block_coverage;

    for (const auto& range : function.ranges) {
      offset_span span;
      if (util::rebase_span(range.start_offset, range.end_offset, body_start, body_length, span)) {
        moved.ranges.push_back(v8cov::range_coverage{span.start, span.end, range.count});
      }
    }

    if (!moved.ranges.empty()) {
      unwrapped.functions.push_back(std::move(moved));
    }
  }
  return unwrapped;
}

} // namespace jscov
