/***
 * Name: pyscope::exceptions::ConfigError
 * Purpose: Exception for configuration and option errors.
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

class ConfigError : public PyscopeException {
 public:
  explicit ConfigError(std::string msg) noexcept : PyscopeException(std::move(msg)) {}
};

}  // namespace exceptions
}  // namespace pyscope
