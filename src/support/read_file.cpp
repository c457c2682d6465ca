/***
 * Name: pyscope::support::ReadFile
 * Purpose: Read the full contents of a text file into a string.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: populated with file contents on success
 *   - err: reason on failure (no path prefix; callers add context)
 * Theory of Operation: Uses std::ifstream in binary mode; checks the stream
 *   state after opening and after draining the buffer.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - include interface to ensure signature stays in sync
#include "pyscope/support/fs.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <ios>
#include <sstream>
#include <string>
#include <system_error>
#include <filesystem>

namespace pyscope {
namespace support {

bool ReadFile(const std::string& path, std::string& out, std::string& err) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    err = "Is a directory";
    return false;
  }
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.good()) {
    err = errno != 0 ? std::strerror(errno) : "failed to open file";
    return false;
  }
  std::ostringstream stream;
  stream << file_stream.rdbuf();
  if (file_stream.bad()) {
    err = "failed to read file";
    return false;
  }
  out = stream.str();
  return true;
}

}  // namespace support
}  // namespace pyscope
