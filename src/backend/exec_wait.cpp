/***
 * Name: pyscope::backend::detail::ExecAndWait
 * Purpose: Exec a command via execvp and wait for completion; capture error.
 * Inputs: argv (mutable, null-terminated)
 * Outputs: true on success (exit 0); false with exit_code and err on failure
 * Theory of Operation: POSIX fork/exec/wait; the child's stdout is left
 *   attached; assembles a display command on error.
 */
#include "pyscope/backend/detail/exec.h"

#include <cerrno>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include <sys/wait.h>
#include <unistd.h>

namespace pyscope {
namespace backend {
namespace detail {

static std::string DisplayCommand(const std::vector<char*>& argv) {
  std::ostringstream assembled;
  for (std::size_t i = 0; i < argv.size() && argv[i] != nullptr; ++i) {
    if (i != 0U) {
      assembled << ' ';
    }
    assembled << argv[i];
  }
  return assembled.str();
}

auto ExecAndWait(std::vector<char*>& argv, int& exit_code, std::string& err) -> bool {
  constexpr int kUnknownExitCode = -1;
  exit_code = kUnknownExitCode;
  if (argv.empty() || argv[0] == nullptr) {
    err = "empty command line";
    return false;
  }
  const auto pid = fork();
  if (pid < 0) {
    err = "failed to fork() for " + std::string(argv[0]);
    return false;
  }
  if (pid == 0) {
    execvp(argv[0], argv.data());
    _exit(kExecFailure);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      err = "failed to waitpid() for " + std::string(argv[0]);
      return false;
    }
  }
  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : kUnknownExitCode;
    err = "command failed (rc=" + std::to_string(exit_code) + "): " + DisplayCommand(argv);
    return false;
  }
  exit_code = 0;
  return true;
}

}  // namespace detail
}  // namespace backend
}  // namespace pyscope
