#include <cstdint>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "commands/convert.hpp"
#include "commands/fixture.hpp"
#include "commands/inspect.hpp"
#include "jscovbase/cli/verbosity.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() { jscov::cli::apply_verbosity(args::get(verbosity_flag)); }
} // namespace cli

namespace {
int g_exit_code = 0;
} // namespace

void cmd_convert(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> source(parser, "path", "path to the script source", {'s', "source"});
  args::ValueFlagList<std::string> coverage(
      parser, "path", "V8 coverage json (repeatable, folded in order)", {'c', "coverage"}
  );
  args::ValueFlag<std::string> url(parser, "url", "script url in the coverage (default: file:// + source)", {'u', "url"});
  args::ValueFlag<std::string> source_type(parser, "type", "script or module", {'t', "source-type"});
  args::ValueFlag<std::string> wrapper(parser, "wrapper", "wrapper around the source (none, cjs)", {"wrapper"});
  args::ValueFlag<uint32_t> wrapper_prefix(parser, "units", "wrapper prefix length", {"wrapper-prefix"});
  args::ValueFlag<uint32_t> wrapper_suffix(parser, "units", "wrapper suffix length", {"wrapper-suffix"});
  args::Flag wrapped_source(parser, "wrapped", "the source file still contains the wrapper", {"wrapped-source"});
  args::ValueFlag<std::string> output(parser, "path", "output file path (default: stdout)", {'o', "output"});
  args::Flag pretty(parser, "pretty", "indent the json output", {"pretty"});
  parser.Parse();

  g_exit_code = jscovtool::commands::convert(
      source, coverage, url, source_type, wrapper, wrapper_prefix, wrapper_suffix, wrapped_source, output, pretty
  );
}

void cmd_fixture(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> fixture(parser, "path", "fixture file (array of source and coverage)", {'f', "fixture"});
  args::ValueFlag<std::string> snapshot(parser, "path", "snapshot file", {"snapshot"});
  args::Flag update(parser, "update", "write the snapshot instead of comparing", {"update"});
  parser.Parse();

  g_exit_code = jscovtool::commands::fixture(fixture, snapshot, update);
}

void cmd_inspect(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> coverage(parser, "path", "V8 coverage json", {'c', "coverage"});
  args::Flag detailed(parser, "detailed", "list functions and ranges", {'d', "detailed"});
  args::ValueFlag<std::string> url(parser, "url", "filter by script url (substring match)", {'u', "url"});
  parser.Parse();

  g_exit_code = jscovtool::commands::inspect(coverage, detailed, url);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser(
      "jscovtool - javascript coverage converter", "convert V8 function coverage into istanbul file coverage"
  );
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command convert_cmd(commands, "convert", "convert V8 coverage of one script to istanbul", &cmd_convert);
  args::Command fixture_cmd(commands, "fixture", "check or update a coverage fixture snapshot", &cmd_fixture);
  args::Command inspect_cmd(commands, "inspect", "summarize V8 coverage files", &cmd_inspect);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  }

  return g_exit_code;
}
