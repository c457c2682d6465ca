/***
 * Name: pyscope::exceptions::ExportError
 * Purpose: Exception for graph export failures (engine faults, unwritable output).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from PyscopeException.
 */
#pragma once

#include <string>
#include <utility>

#include "pyscope/exceptions/pyscope_exception.h"

namespace pyscope {
namespace exceptions {

class ExportError : public PyscopeException {
 public:
  explicit ExportError(std::string msg) noexcept : PyscopeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyscope
