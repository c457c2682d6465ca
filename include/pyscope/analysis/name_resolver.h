/***
 * Name: pyscope::analysis (name resolver)
 * Purpose: Turn an expression into its best dotted textual name.
 * Inputs: Expression node (may be null)
 * Outputs: "a.b.c", "f(...)", literal text, or kUnresolvedName
 * Theory of Operation: Purely syntactic; never consults a symbol table, so
 *   `self.other()` resolves to "self.other(...)" and its callee to "self.other".
 */
#pragma once

#include <string>

#include "ast/Expr.h"

namespace pyscope {
namespace analysis {

inline constexpr const char* kUnresolvedName = "<?>";

/*** ResolveName: identifier, attribute chain, call shape or literal; "<?>" otherwise. */
std::string ResolveName(const ast::Expr* expr);

/*** QuoteLiteral: Python-style single-quoted rendering of decoded string/bytes text. */
std::string QuoteLiteral(const std::string& value, bool bytes);

}  // namespace analysis
}  // namespace pyscope
