/***
 * Name: pyscope::driver::detail::HandleHelpArg
 * Purpose: Recognize -h/--help and set the show_help flag.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: OptResult::Handled when matched, NotMatched otherwise
 */
#include "pyscope/driver/cli_parse.h"
#include "pyscope/driver/cli.h"

#include <string>

namespace pyscope {
namespace driver {
namespace detail {

auto HandleHelpArg(const std::string& arg, CliOptions& dst) -> OptResult {
  if (arg == "-h" || arg == "--help") {
    dst.show_help = true;
    return OptResult::Handled;
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace pyscope
