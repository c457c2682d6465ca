/***
 * Name: pyscope::backend::detail (exec helpers)
 * Purpose: Internal helpers to build argv and exec/wait for the layout engine.
 * Inputs: Vector<string> for argv construction; argv for exec; error string
 * Outputs: Mutable argv pointer array; exit code and error text
 * Theory of Operation: Keep the exporter small; no shell is involved so
 *   paths with spaces or metacharacters pass through unchanged.
 */
#pragma once

#include <string>
#include <vector>

namespace pyscope {
namespace backend {
namespace detail {

/*** Exit status used by the child when execvp itself fails. */
constexpr int kExecFailure = 127;

/*** BuildArgvMutable: Build null-terminated argv pointers referencing args storage. */
std::vector<char*> BuildArgvMutable(std::vector<std::string>& args);

/***
 * ExecAndWait: fork/execvp and wait. Returns true on exit code 0; otherwise
 * fills err and sets exit_code (kExecFailure when the program could not be
 * started, -1 for abnormal termination or fork/wait failures).
 */
bool ExecAndWait(std::vector<char*>& argv, int& exit_code, std::string& err);

}  // namespace detail
}  // namespace backend
}  // namespace pyscope
