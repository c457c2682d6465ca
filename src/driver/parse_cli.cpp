/***
 * Name: pyscope::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation:
 *   Normalizes argv, runs the handler table for each argument, then
 *   validates. ConfigError from handlers or validation is reported here.
 */
#include "pyscope/driver/cli.h"
#include "pyscope/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <vector>

#include "pyscope/exceptions/config_error.h"

namespace pyscope::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  dst = CliOptions{};
  std::vector<std::string> args;
  detail::NormalizeArgv(argc, argv, args);
  try {
    for (int arg_index = 1; arg_index < argc; ++arg_index) {
      if (detail::RunHandlers(args, arg_index, argc, dst, err) == detail::OptResult::Error) {
        return false;
      }
    }
    detail::ValidateOptions(dst);
  } catch (const exceptions::ConfigError& ex) {
    err << "pyscope: error: " << ex.what() << '\n';
    return false;
  }
  return true;
}

}  // namespace pyscope::driver
