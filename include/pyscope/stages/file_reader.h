/***
 * Name: pyscope::stages::FileReader
 * Purpose: Stage class for reading an input source file.
 * Inputs: Filesystem path
 * Outputs: Source string
 * Theory of Operation: Checks existence first (NotFound), then wraps
 *   support::ReadFile (ReadFailure); instruments metrics via RAII.
 */
#pragma once

#include <string>

#include "pyscope/metrics/metrics.h"
#include "pyscope/support/error.h"

namespace pyscope {
namespace stages {

class FileReader : public metrics::Metrics {
 public:
  /*** Read: Read file at path into out_src. */
  static bool Read(const std::string& path, std::string& out_src, support::Error& err);
};

}  // namespace stages
}  // namespace pyscope
