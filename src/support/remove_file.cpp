/***
 * Name: pyscope::support::RemoveFile / FileExists
 * Purpose: Best-effort removal of temporary and partial artifacts; existence probe.
 * Inputs:
 *   - path: file to remove or test
 * Outputs: true when the file is gone afterwards (or exists, for FileExists)
 * Theory of Operation: std::filesystem with error_code overloads; never throws.
 */
#include "pyscope/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace pyscope::support {

bool RemoveFile(const std::string& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  return !ec;
}

bool FileExists(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

}  // namespace pyscope::support
