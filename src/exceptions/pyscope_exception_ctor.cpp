/***
 * Name: pyscope::exceptions::PyscopeException::PyscopeException
 * Purpose: Construct base exception with a message.
 * Inputs:
 *   - msg: human-readable error description
 * Outputs: Initialized exception object
 * Theory of Operation: Stores the message for later retrieval by what().
 */
#include "pyscope/exceptions/pyscope_exception.h"

#include <string>
#include <utility>

namespace pyscope {
namespace exceptions {

PyscopeException::PyscopeException(std::string msg) noexcept : message_(std::move(msg)) {}

}  // namespace exceptions
}  // namespace pyscope
