#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <jscovformats/istanbul.hpp>
#include <jscovformats/v8cov.hpp>

#include "jscov/unwrap.hpp"
#include "jscovsyntax/source_type.hpp"

namespace jscov {

// one-shot conversion of a single snapshot
istanbul::file_coverage istanbulize(std::string source_text, syntax::source_type type, const v8cov::script_coverage& script);

// folds an ordered list of snapshots of the same script into one report
istanbul::file_coverage fold_coverage(
    std::string source_text, syntax::source_type type, const std::vector<v8cov::script_coverage>& snapshots
);

/**
 * @brief Converts coverage of a script the engine evaluated inside a wrapper.
 *
 * `source_text` is the script as stored on disk, without the wrapper. When `wrapper` is set
 * every snapshot is unwrapped onto that text before folding.
 */
istanbul::file_coverage convert_wrapped(
    std::string_view source_text, syntax::source_type type, const std::vector<v8cov::script_coverage>& snapshots,
    const std::optional<wrapper_lengths>& wrapper
);

} // namespace jscov
