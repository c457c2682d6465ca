/***
 * Name: pyscope::backend::detail::BuildArgvMutable
 * Purpose: Construct a null-terminated argv array from a vector<string>.
 * Inputs: args (vector<string>)
 * Outputs: vector<char*> suitable for execvp
 * Theory of Operation: Pointers reference the string storage; args must
 *   outlive the returned vector and must not be resized meanwhile.
 */
#include "pyscope/backend/detail/exec.h"

#include <string>
#include <vector>

namespace pyscope {
namespace backend {
namespace detail {

auto BuildArgvMutable(std::vector<std::string>& args) -> std::vector<char*> {
  std::vector<char*> argv;
  argv.reserve(args.size() + 1U);
  for (auto& arg_str : args) {
    argv.push_back(arg_str.data());
  }
  argv.push_back(nullptr);
  return argv;
}

}  // namespace detail
}  // namespace backend
}  // namespace pyscope
