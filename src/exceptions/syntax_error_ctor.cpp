/***
 * Name: pyscope::exceptions::SyntaxError::SyntaxError
 * Purpose: Construct a syntax failure carrying its source location.
 * Inputs:
 *   - msg: rendered diagnostic text
 *   - file, line, col: location of the first offending token
 * Outputs: Initialized exception object
 * Theory of Operation: Forwards the message to the base and keeps the location.
 */
#include "pyscope/exceptions/syntax_error.h"

#include <string>
#include <utility>

namespace pyscope::exceptions {

SyntaxError::SyntaxError(std::string msg, std::string file, int line, int col) noexcept
    : PyscopeException(std::move(msg)), file_(std::move(file)), line_(line), col_(col) {}

}  // namespace pyscope::exceptions
