/***
 * Name: pyscope::driver::detail::HandleOutputArg
 * Purpose: Handle the graph destination: -o <path>, --graph <path>, --graph=<path>.
 * Inputs:
 *   - args: full argument vector
 *   - index: current index (advanced to consume a separate path)
 *   - argc: total argument count
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: A separate value must follow; an empty path is rejected.
 */
#include "pyscope/driver/cli_parse.h"
#include "pyscope/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pyscope {
namespace driver {
namespace detail {

auto HandleOutputArg(const std::vector<std::string>& args,
                     int& index,
                     int argc,
                     CliOptions& dst,
                     std::ostream& err) -> OptResult {
  const std::string& arg = args[static_cast<std::size_t>(index)];
  constexpr std::string_view kPrefix{"--graph="};
  std::string value;
  if (arg.rfind(kPrefix, 0) == 0U) {
    value = arg.substr(kPrefix.size());
  } else if (arg == "-o" || arg == "--graph") {
    if (index + 1 >= argc) {
      err << "pyscope: error: missing path after '" << arg << "'" << '\n';
      return OptResult::Error;
    }
    ++index;
    value = args[static_cast<std::size_t>(index)];
  } else {
    return OptResult::NotMatched;
  }
  if (value.empty()) {
    err << "pyscope: error: empty graph path" << '\n';
    return OptResult::Error;
  }
  dst.graph_path = value;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace pyscope
