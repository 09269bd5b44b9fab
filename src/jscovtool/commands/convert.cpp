#include "convert.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <jscovformats/istanbul.hpp>
#include <redlog.hpp>

#include "io.hpp"
#include "jscov/error.hpp"
#include "jscov/istanbulize.hpp"
#include "jscov/unwrap.hpp"
#include "jscovbase/string_utils.hpp"
#include "jscovsyntax/syntax_error.hpp"

namespace jscovtool::commands {

namespace {

template <typename T> std::optional<T> flag_value(args::ValueFlag<T>& flag) {
  if (!flag) {
    return std::nullopt;
  }
  return args::get(flag);
}

} // namespace

jscov::convert_config resolve_config(const convert_options& options) {
  auto config = jscov::convert_config::from_environment();

  if (options.source_type) {
    auto type = jscov::syntax::parse_source_type(jscov::util::to_lower(*options.source_type));
    if (!type) {
      throw std::invalid_argument("unknown source type: " + *options.source_type);
    }
    config.source_type = *type;
  }
  if (options.wrapper) {
    std::string wrapper = jscov::util::to_lower(*options.wrapper);
    if (wrapper == "none") {
      config.wrapper = jscov::wrapper_mode::none;
    } else if (wrapper == "cjs" || wrapper == "commonjs") {
      config.wrapper = jscov::wrapper_mode::commonjs;
    } else {
      throw std::invalid_argument("unknown wrapper: " + *options.wrapper);
    }
  }
  if (options.wrapper_prefix) {
    config.wrapper_prefix = options.wrapper_prefix;
  }
  if (options.wrapper_suffix) {
    config.wrapper_suffix = options.wrapper_suffix;
  }
  if (options.output) {
    config.output = *options.output;
  }
  if (options.pretty) {
    config.pretty = true;
  }
  return config;
}

std::string default_url(const std::string& source_path) {
  return "file://" + std::filesystem::absolute(source_path).string();
}

std::vector<v8cov::script_coverage> collect_scripts(const std::vector<std::string>& coverage_paths, const std::string& url) {
  auto log = redlog::get_logger("jscovtool.convert");

  std::vector<v8cov::script_coverage> snapshots;
  for (const auto& coverage_path : coverage_paths) {
    auto process = v8cov::read(coverage_path);
    size_t before = snapshots.size();
    for (const auto* script : process.find(url)) {
      snapshots.push_back(*script);
    }
    log.dbg(
        "read coverage file", redlog::field("path", coverage_path), redlog::field("scripts", process.result.size()),
        redlog::field("matching", snapshots.size() - before)
    );
  }
  return snapshots;
}

int convert(const convert_options& options) {
  auto log = redlog::get_logger("jscovtool.convert");

  if (options.source.empty()) {
    log.err("source path required");
    return 1;
  }
  if (options.coverage.empty()) {
    log.err("at least one coverage file required");
    return 1;
  }

  try {
    auto config = resolve_config(options);

    std::string url = options.url ? *options.url : default_url(options.source);
    if (!jscov::util::starts_with(url, "file://")) {
      log.err("only file urls can be converted", redlog::field("url", url));
      return 1;
    }

    std::string source_text = read_text_file(options.source);
    auto snapshots = collect_scripts(options.coverage, url);
    if (snapshots.empty()) {
      log.err("no script coverage matches url", redlog::field("url", url));
      return 1;
    }

    log.inf(
        "converting coverage", redlog::field("source", options.source), redlog::field("url", url),
        redlog::field("snapshots", snapshots.size()),
        redlog::field("source_type", jscov::syntax::source_type_name(config.source_type)),
        redlog::field("wrapper", jscov::wrapper_mode_name(config.wrapper))
    );

    auto wrapper = config.resolve_wrapper_lengths();
    if (options.wrapped_source) {
      if (!wrapper) {
        log.err("--wrapped-source needs a wrapper");
        return 1;
      }
      source_text = jscov::unwrap_source_text(source_text, *wrapper);
    }

    auto report = jscov::convert_wrapped(source_text, config.source_type, snapshots, wrapper);
    istanbul::coverage_map map{report};
    int indent = config.pretty ? 2 : -1;

    if (config.output.empty()) {
      istanbul::write(std::cout, map, indent);
    } else {
      istanbul::write(config.output, map, indent);
      log.inf("wrote istanbul coverage", redlog::field("output", config.output));
    }
  } catch (const jscov::syntax::syntax_error& e) {
    log.err(
        "source does not parse", redlog::field("source", options.source), redlog::field("error", e.reason()),
        redlog::field("line", e.position().line), redlog::field("column", e.position().column)
    );
    return 1;
  } catch (const jscov::coverage_error& e) {
    log.err(
        "coverage does not fit the source", redlog::field("code", std::string(jscov::error_code_name(e.code()))),
        redlog::field("error", e.what())
    );
    return 1;
  } catch (const std::exception& e) {
    log.err("conversion failed", redlog::field("error", e.what()));
    return 1;
  }

  return 0;
}

int convert(
    args::ValueFlag<std::string>& source_flag, args::ValueFlagList<std::string>& coverage_flag,
    args::ValueFlag<std::string>& url_flag, args::ValueFlag<std::string>& source_type_flag,
    args::ValueFlag<std::string>& wrapper_flag, args::ValueFlag<uint32_t>& prefix_flag,
    args::ValueFlag<uint32_t>& suffix_flag, args::Flag& wrapped_source_flag, args::ValueFlag<std::string>& output_flag,
    args::Flag& pretty_flag
) {
  convert_options options;
  if (source_flag) {
    options.source = args::get(source_flag);
  }
  if (coverage_flag) {
    options.coverage = args::get(coverage_flag);
  }
  options.url = flag_value(url_flag);
  options.source_type = flag_value(source_type_flag);
  options.wrapper = flag_value(wrapper_flag);
  options.wrapper_prefix = flag_value(prefix_flag);
  options.wrapper_suffix = flag_value(suffix_flag);
  options.wrapped_source = args::get(wrapped_source_flag);
  options.output = flag_value(output_flag);
  options.pretty = args::get(pretty_flag);
  return convert(options);
}

} // namespace jscovtool::commands
