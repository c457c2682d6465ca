/***
 * Name: pyscope::obs::AstPrinter
 * Purpose: AST pretty-printer for diagnostics/logging (--log-ast).
 * Inputs:
 *   - ast::Module (or any node)
 * Outputs:
 *   - Formatted string with node kinds, salient fields and locations.
 * Theory of Operation:
 *   Walks the tree through ast::forEachChild, emitting one line per node
 *   with indentation reflecting tree depth.
 */
#pragma once

#include <sstream>
#include <string>

#include "ast/Node.h"

namespace pyscope::obs {

class AstPrinter {
 public:
  std::string print(const ast::Node& root);

  // Kind-specific detail appended after the kind name ("" when none)
  static std::string detail(const ast::Node& node);

 private:
  void emit(const ast::Node& node);
  std::ostringstream ss_{};
  int depth_{0};
};

} // namespace pyscope::obs
