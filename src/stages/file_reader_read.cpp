/***
 * Name: pyscope::stages::FileReader::Read
 * Purpose: Read a file from disk and record metrics for ReadFile phase.
 * Inputs:
 *   - path: file path
 * Outputs:
 *   - out_src: populated with contents on success
 *   - err: NotFound or ReadFailure
 * Theory of Operation: Existence is checked before any read attempt;
 *   timings via Metrics::ScopedTimer.
 */
#include "pyscope/stages/file_reader.h"

#include "pyscope/metrics/metrics.h"  // direct use of Metrics::ScopedTimer
#include "pyscope/support/fs.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace pyscope::stages {

auto FileReader::Read(const std::string& path, std::string& out_src, support::Error& err) -> bool {
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::ReadFile);
  std::error_code ec;
  if (path.empty() || !std::filesystem::exists(path, ec)) {
    err = support::Error{support::ErrorKind::NotFound, "Error: File does not exist '" + path + "'"};
    return false;
  }
  std::string reason;
  if (!support::ReadFile(path, out_src, reason)) {
    err = support::Error{support::ErrorKind::ReadFailure, "Error: Could not read file '" + path + "': " + reason};
    return false;
  }
  return true;
}

}  // namespace pyscope::stages
