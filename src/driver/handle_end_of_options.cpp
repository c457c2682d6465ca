/***
 * Name: pyscope::driver::detail::HandleEndOfOptions
 * Purpose: Handle "--": every remaining argument is a positional input.
 * Inputs: args, index (advanced to argc), argc, dst
 * Outputs: OptResult::Handled when matched
 */
#include "pyscope/driver/cli_parse.h"
#include "pyscope/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <string>
#include <vector>

namespace pyscope {
namespace driver {
namespace detail {

auto HandleEndOfOptions(const std::vector<std::string>& args,
                        int& index,
                        int argc,
                        CliOptions& dst) -> OptResult {
  const std::string& arg = args[static_cast<std::size_t>(index)];
  if (arg != "--") {
    return OptResult::NotMatched;
  }
  for (++index; index < argc; ++index) {
    dst.inputs.emplace_back(args[static_cast<std::size_t>(index)]);
  }
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace pyscope
