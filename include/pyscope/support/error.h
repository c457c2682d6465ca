/***
 * Name: pyscope::support::Error
 * Purpose: Failure value returned across public operation boundaries.
 * Inputs: ErrorKind and a user-presentable message
 * Outputs: Consumed by the driver (printed) and by tests (kind checks)
 * Theory of Operation: Exceptions stay inside a stage; each stage catches
 *   at its boundary and returns false plus an Error.
 */
#pragma once

#include <string>

namespace pyscope {
namespace support {

enum class ErrorKind { None, NotFound, ReadFailure, SyntaxFailure, UnknownParseFailure, EngineMissing, ExportFailure };

struct Error {
  ErrorKind kind{ErrorKind::None};
  std::string message;
};

}  // namespace support
}  // namespace pyscope
