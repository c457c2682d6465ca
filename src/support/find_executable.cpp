/***
 * Name: pyscope::support::FindExecutable
 * Purpose: Locate an executable by name on PATH.
 * Inputs:
 *   - name: bare program name ("dot") or a path containing '/'
 * Outputs:
 *   - out: resolved path on success
 * Theory of Operation: A name with a slash is checked as-is; otherwise each
 *   PATH entry (empty entries meaning the current directory) is probed with
 *   access(X_OK) on a regular file.
 */
#include "pyscope/support/fs.h"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

#include <unistd.h>

namespace pyscope::support {

static bool IsExecutableFile(const std::string& candidate) {
  std::error_code ec;
  return std::filesystem::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0;
}

bool FindExecutable(const std::string& name, std::string& out) {
  if (name.empty()) {
    return false;
  }
  if (name.find('/') != std::string::npos) {
    if (!IsExecutableFile(name)) {
      return false;
    }
    out = name;
    return true;
  }
  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return false;
  }
  const std::string path_list{path_env};
  std::string::size_type start = 0;
  while (start <= path_list.size()) {
    auto end = path_list.find(':', start);
    if (end == std::string::npos) {
      end = path_list.size();
    }
    std::string dir = path_list.substr(start, end - start);
    if (dir.empty()) {
      dir = ".";
    }
    const std::string candidate = dir + "/" + name;
    if (IsExecutableFile(candidate)) {
      out = candidate;
      return true;
    }
    start = end + 1;
  }
  return false;
}

}  // namespace pyscope::support
