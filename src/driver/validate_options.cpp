/***
 * Name: pyscope::driver::detail::ValidateOptions
 * Purpose: Reject option combinations that cannot run.
 * Inputs: opts (fully parsed)
 * Outputs: None; throws exceptions::ConfigError
 * Theory of Operation: Help short-circuits every other check.
 */
#include "pyscope/driver/cli_parse.h"

#include "pyscope/exceptions/config_error.h"

namespace pyscope::driver::detail {

void ValidateOptions(const CliOptions& opts) {
  if (opts.show_help) {
    return;
  }
  if (opts.inputs.empty()) {
    throw exceptions::ConfigError("no input file");
  }
  if (opts.inputs.size() != 1U) {
    throw exceptions::ConfigError("exactly one input file is supported");
  }
  if ((opts.log_lexer || opts.log_ast) && opts.log_path.empty()) {
    throw exceptions::ConfigError("--log-lexer and --log-ast require --log-path=<dir>");
  }
}

}  // namespace pyscope::driver::detail
