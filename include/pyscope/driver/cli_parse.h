/***
 * Name: pyscope::driver (cli_parse helpers)
 * Purpose: Declarations for small, single-purpose CLI option handlers used by ParseCli.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: Each function recognizes one category of options, mutates state,
 *   and advances the index where necessary, keeping ParseCli simple and low complexity.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "pyscope/driver/cli.h"

namespace pyscope {
namespace driver {
namespace detail {

/*** HandleHelpArg: Recognize -h/--help and set flag. */
OptResult HandleHelpArg(const std::string& arg, CliOptions& dst);

/*** HandleMetricsArg: Parse --metrics, --metrics-json and --metrics=json|text. */
OptResult HandleMetricsArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleSwitch: Boolean flags --text, --log-lexer, --log-ast. */
OptResult HandleSwitch(const std::string& arg, CliOptions& dst);

/*** HandleOutputArg: Handle -o <path>, --graph <path> and --graph=<path>. */
OptResult HandleOutputArg(const std::vector<std::string>& args,
                          int& index,
                          int argc,
                          CliOptions& dst,
                          std::ostream& err);

/***
 * HandleValueArg: Handle --format, --engine and --log-path in both
 * "--opt=value" and "--opt value" spellings. Throws ConfigError for an
 * unknown format.
 */
OptResult HandleValueArg(const std::vector<std::string>& args,
                         int& index,
                         int argc,
                         CliOptions& dst,
                         std::ostream& err);

/*** HandleEndOfOptions: Handle "--" and push remaining inputs. */
OptResult HandleEndOfOptions(const std::vector<std::string>& args,
                             int& index,
                             int argc,
                             CliOptions& dst);

/*** HandleUnknownOrPositional: Error on unknown '-' options; otherwise record input. */
OptResult HandleUnknownOrPositional(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** NormalizeArgv: Convert argv into vector<string> with null safety. */
void NormalizeArgv(int argc, const char* const* argv, std::vector<std::string>& out);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err);

/*** ValidateOptions: Cross-option checks after parsing; throws ConfigError. */
void ValidateOptions(const CliOptions& opts);

}  // namespace detail
}  // namespace driver
}  // namespace pyscope
