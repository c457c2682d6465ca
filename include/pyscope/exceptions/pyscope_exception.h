/***
 * Name: pyscope::exceptions::PyscopeException
 * Purpose: Base class for all pyscope exceptions; do not use built-in exceptions directly.
 * Inputs: Message string describing the error condition
 * Outputs: Exception object providing `what()` text
 * Theory of Operation: Derives from std::exception to interoperate with catch sites,
 *   but all throws in pyscope must use a custom type derived from this base.
 */
#pragma once

#include <exception>
#include <string>

namespace pyscope {
namespace exceptions {

class PyscopeException : public std::exception {
 public:
  virtual ~PyscopeException() noexcept = default;
  const char* what() const noexcept override;

 protected:
  explicit PyscopeException(std::string msg) noexcept;
  std::string message_;
};

}  // namespace exceptions
}  // namespace pyscope
