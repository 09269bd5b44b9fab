#pragma once

#include <string>

#include <args.hxx>

namespace jscovtool::commands {

/**
 * inspect command - summarizes the scripts and functions of a V8 coverage file
 *
 * @param coverage_flag path to the coverage file
 * @param detailed_flag list every function with its ranges (optional)
 * @param url_flag filter by script url substring (optional)
 * @return exit code (0 for success, 1 for failure)
 */
int inspect(args::ValueFlag<std::string>& coverage_flag, args::Flag& detailed_flag, args::ValueFlag<std::string>& url_flag);

} // namespace jscovtool::commands
