/***
 * Name: pyscope::driver::WriteFileOrReport
 * Purpose: Write a file and print an error to stderr on failure.
 * Inputs: path, data, err (for detail)
 * Outputs: true on success, false on error (and message printed)
 * Theory of Operation: Wraps support::WriteFile with unified reporting.
 */
// NOLINTNEXTLINE(misc-include-cleaner) - interface for declarations
#include "pyscope/driver/app.h"
#include "pyscope/support/fs.h"

#include <iostream>
#include <string>

namespace pyscope::driver {

auto WriteFileOrReport(const std::string& path, const std::string& data, std::string& err) -> bool {
  const bool is_ok = support::WriteFile(path, data, err);
  if (!is_ok) {
    std::cerr << "pyscope: " << err << '\n';
  }
  return is_ok;
}

}  // namespace pyscope::driver
