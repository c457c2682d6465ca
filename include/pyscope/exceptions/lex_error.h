/***
 * Name: pyscope::exceptions::LexError
 * Purpose: Exception for tokenizer failures (bad characters, unterminated strings, indentation).
 * Inputs: Error message
 * Outputs: Exception object
 * Theory of Operation: Marker type deriving from SyntaxError.
 */
#pragma once

#include "pyscope/exceptions/syntax_error.h"

namespace pyscope {
namespace exceptions {

class LexError : public SyntaxError {
 public:
  using SyntaxError::SyntaxError;
};

}  // namespace exceptions
}  // namespace pyscope
