/***
 * Name: pyscope::exceptions::EngineMissingError
 * Purpose: Exception raised when the Graphviz layout engine cannot be located or executed.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Refines ExportError so generic export handlers still catch it.
 */
#pragma once

#include "pyscope/exceptions/export_error.h"

namespace pyscope {
namespace exceptions {

class EngineMissingError : public ExportError {
 public:
  using ExportError::ExportError;
};

}  // namespace exceptions
}  // namespace pyscope
