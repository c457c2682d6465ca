/***
 * Name: pyscope::exceptions::FileReadError
 * Purpose: Exception for filesystem read failures.
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

class FileReadError : public PyscopeException {
 public:
  explicit FileReadError(std::string msg) noexcept : PyscopeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyscope
