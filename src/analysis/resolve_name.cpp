/***
 * Name: pyscope::analysis::ResolveName
 * Purpose: Best textual representation of an expression.
 * Inputs:
 *   - expr: expression node or nullptr
 * Outputs: dotted name, "callee(...)", literal text, or "<?>"
 * Theory of Operation: Exhaustive switch over NodeKind; only names,
 *   attributes, calls and constants have a textual form.
 */
#include "pyscope/analysis/name_resolver.h"

#include <string>

#include "ast/Nodes.h"

namespace pyscope::analysis {

// NOLINTNEXTLINE(readability-function-size)
std::string ResolveName(const ast::Expr* expr) {
  if (expr == nullptr) {
    return kUnresolvedName;
  }
  using NK = ast::NodeKind;
  switch (expr->kind) {
    case NK::Name:
      return static_cast<const ast::Name*>(expr)->id;
    case NK::Attribute: {
      const auto* attr = static_cast<const ast::Attribute*>(expr);
      return ResolveName(attr->value.get()) + "." + attr->attr;
    }
    case NK::Call:
      return ResolveName(static_cast<const ast::Call*>(expr)->callee.get()) + "(...)";
    case NK::IntLiteral:
      return static_cast<const ast::IntLiteral*>(expr)->value;
    case NK::FloatLiteral:
      return static_cast<const ast::FloatLiteral*>(expr)->value;
    case NK::ImagLiteral:
      return static_cast<const ast::ImagLiteral*>(expr)->value;
    case NK::StringLiteral:
      return QuoteLiteral(static_cast<const ast::StringLiteral*>(expr)->value, false);
    case NK::BytesLiteral:
      return QuoteLiteral(static_cast<const ast::BytesLiteral*>(expr)->value, true);
    case NK::BoolLiteral:
      return static_cast<const ast::BoolLiteral*>(expr)->value ? "True" : "False";
    case NK::NoneLiteral:
      return "None";
    case NK::EllipsisLiteral:
      return "...";
    case NK::Module:
    case NK::FunctionDef:
    case NK::ClassDef:
    case NK::ReturnStmt:
    case NK::AssignStmt:
    case NK::AugAssignStmt:
    case NK::AnnAssignStmt:
    case NK::ExprStmt:
    case NK::IfStmt:
    case NK::WhileStmt:
    case NK::ForStmt:
    case NK::TryStmt:
    case NK::ExceptHandler:
    case NK::WithStmt:
    case NK::WithItem:
    case NK::Import:
    case NK::ImportFrom:
    case NK::RaiseStmt:
    case NK::GlobalStmt:
    case NK::NonlocalStmt:
    case NK::AssertStmt:
    case NK::DelStmt:
    case NK::PassStmt:
    case NK::BreakStmt:
    case NK::ContinueStmt:
    case NK::MatchStmt:
    case NK::MatchCase:
    case NK::Subscript:
    case NK::Slice:
    case NK::Starred:
    case NK::FStringLiteral:
    case NK::BinaryExpr:
    case NK::UnaryExpr:
    case NK::Compare:
    case NK::IfExpr:
    case NK::LambdaExpr:
    case NK::NamedExpr:
    case NK::TupleLiteral:
    case NK::ListLiteral:
    case NK::SetLiteral:
    case NK::DictLiteral:
    case NK::ListComp:
    case NK::SetComp:
    case NK::DictComp:
    case NK::GeneratorExpr:
    case NK::YieldExpr:
    case NK::AwaitExpr:
    case NK::PatternWildcard:
    case NK::PatternName:
    case NK::PatternLiteral:
    case NK::PatternOr:
    case NK::PatternAs:
    case NK::PatternClass:
    case NK::PatternSequence:
    case NK::PatternMapping:
    case NK::PatternStar:
      return kUnresolvedName;
  }
  return kUnresolvedName;
}

}  // namespace pyscope::analysis
