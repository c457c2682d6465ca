/***
 * Name: pyscope::driver::detail::HandleSwitch
 * Purpose: Handle boolean switches --text, --log-lexer and --log-ast.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult::Handled when matched
 */
#include "pyscope/driver/cli_parse.h"
#include "pyscope/driver/cli.h"  // direct use of CliOptions

#include <string>

namespace pyscope {
namespace driver {
namespace detail {

auto HandleSwitch(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "--text") {
    dst.text = true;
    return OptResult::Handled;
  }
  if (arg == "--log-lexer") {
    dst.log_lexer = true;
    return OptResult::Handled;
  }
  if (arg == "--log-ast") {
    dst.log_ast = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace pyscope
