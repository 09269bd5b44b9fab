#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <args.hxx>
#include <jscovformats/v8cov.hpp>

#include "jscov/convert_config.hpp"

namespace jscovtool::commands {

struct convert_options {
  std::string source;
  std::vector<std::string> coverage; // applied in order
  std::optional<std::string> url;    // default file:// + absolute source path
  std::optional<std::string> source_type;
  std::optional<std::string> wrapper;
  std::optional<uint32_t> wrapper_prefix;
  std::optional<uint32_t> wrapper_suffix;
  bool wrapped_source = false; // the source file was captured with the wrapper around it
  std::optional<std::string> output;
  bool pretty = false;
};

/**
 * Starts from `convert_config::from_environment()`; every option that was given wins over its
 * JSCOV_* variable.
 *
 * @throws std::invalid_argument for an unknown source type or wrapper name
 */
jscov::convert_config resolve_config(const convert_options& options);

std::string default_url(const std::string& source_path);

/**
 * Reads every coverage file and keeps the scripts whose url equals `url`, file by file in the
 * order given and in document order within a file.
 */
std::vector<v8cov::script_coverage> collect_scripts(const std::vector<std::string>& coverage_paths, const std::string& url);

/**
 * convert command - folds V8 coverage of one script into istanbul file coverage
 *
 * @return exit code (0 for success, 1 for failure)
 */
int convert(const convert_options& options);

int convert(
    args::ValueFlag<std::string>& source_flag, args::ValueFlagList<std::string>& coverage_flag,
    args::ValueFlag<std::string>& url_flag, args::ValueFlag<std::string>& source_type_flag,
    args::ValueFlag<std::string>& wrapper_flag, args::ValueFlag<uint32_t>& prefix_flag,
    args::ValueFlag<uint32_t>& suffix_flag, args::Flag& wrapped_source_flag, args::ValueFlag<std::string>& output_flag,
    args::Flag& pretty_flag
);

} // namespace jscovtool::commands
