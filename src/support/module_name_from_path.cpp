/***
 * Name: pyscope::support::ModuleNameFromPath
 * Purpose: Derive the module name used for scope ids from a source path.
 * Inputs:
 *   - path: source file path ("pkg/mod.py")
 * Outputs: "mod"
 * Theory of Operation: The file stem: final path component without its last
 *   extension, whatever that extension is ("mod.pyw" -> "mod").
 */
#include "pyscope/support/fs.h"

#include <filesystem>
#include <string>

namespace pyscope::support {

std::string ModuleNameFromPath(const std::string& path) {
  return std::filesystem::path(path).stem().string();
}

}  // namespace pyscope::support
