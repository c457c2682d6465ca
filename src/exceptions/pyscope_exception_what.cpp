/***
 * Name: pyscope::exceptions::PyscopeException::what
 * Purpose: Return the stored error message.
 * Inputs: none
 * Outputs: C-string pointer valid for the lifetime of the exception
 * Theory of Operation: Returns message_.c_str(); noexcept.
 */
#include "pyscope/exceptions/pyscope_exception.h"

namespace pyscope::exceptions {

const char* PyscopeException::what() const noexcept { return message_.c_str(); }

}  // namespace pyscope::exceptions
