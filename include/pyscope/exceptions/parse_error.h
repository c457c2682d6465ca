/***
 * Name: pyscope::exceptions::ParseError
 * Purpose: Exception for grammar failures reported by the parser.
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from SyntaxError.
 */
#pragma once

#include "pyscope/exceptions/syntax_error.h"

namespace pyscope {
namespace exceptions {

class ParseError : public SyntaxError {
 public:
  using SyntaxError::SyntaxError;
};

}  // namespace exceptions
}  // namespace pyscope
