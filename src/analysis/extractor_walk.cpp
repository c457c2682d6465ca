/***
 * Name: pyscope::analysis::StructuralExtractor::extract / walk
 * Purpose: Drive the extraction walk over every node kind.
 * Inputs:
 *   - module: parsed module
 *   - module_name: file stem used as the scope-id root
 * Outputs: complete Structure (never partial; the walk does not fail)
 * Theory of Operation: Exhaustive switch without a default so a new NodeKind
 *   fails the build until it is classified here.
 */
#include "pyscope/analysis/extractor.h"

#include <string>
#include <utility>

#include "ast/Children.h"
#include "pyscope/analysis/name_resolver.h"

namespace pyscope::analysis {

Structure StructuralExtractor::extract(const ast::Module& module, const std::string& module_name) {
  out_ = Structure{};
  out_.module_name = module_name;
  walk(module, ScopeContext{module_name});
  return std::move(out_);
}

void StructuralExtractor::walkChildren(const ast::Node& node, const ScopeContext& scope) {
  ast::forEachChild(node, [&](const ast::Node& child) { walk(child, scope); });
}

// NOLINTNEXTLINE(readability-function-size)
void StructuralExtractor::walk(const ast::Node& node, const ScopeContext& scope) {
  using NK = ast::NodeKind;
  switch (node.kind) {
    case NK::ClassDef:
      onClassDef(static_cast<const ast::ClassDef&>(node), scope);
      return;
    case NK::FunctionDef:
      onFunctionDef(static_cast<const ast::FunctionDef&>(node), scope);
      return;
    case NK::AssignStmt:
      onAssign(static_cast<const ast::AssignStmt&>(node), scope);
      break;
    case NK::AnnAssignStmt:
      onAnnAssign(static_cast<const ast::AnnAssignStmt&>(node), scope);
      break;
    case NK::Import:
      onImport(static_cast<const ast::Import&>(node));
      break;
    case NK::ImportFrom:
      onImportFrom(static_cast<const ast::ImportFrom&>(node));
      break;
    case NK::Call:
      onCall(static_cast<const ast::Call&>(node), scope);
      break;
    case NK::IfStmt:
      addFlow(CalleeKind::Condition, static_cast<const ast::IfStmt&>(node).cond.get(), scope);
      break;
    case NK::ForStmt:
      addFlow(CalleeKind::ForLoop, static_cast<const ast::ForStmt&>(node).iterable.get(), scope);
      break;
    case NK::WhileStmt:
      addFlow(CalleeKind::WhileLoop, static_cast<const ast::WhileStmt&>(node).cond.get(), scope);
      break;
    // no record of their own; children are still visited
    case NK::Module:
    case NK::ReturnStmt:
    case NK::AugAssignStmt:
    case NK::ExprStmt:
    case NK::TryStmt:
    case NK::ExceptHandler:
    case NK::WithStmt:
    case NK::WithItem:
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
    case NK::Name:
    case NK::Attribute:
    case NK::Subscript:
    case NK::Slice:
    case NK::Starred:
    case NK::IntLiteral:
    case NK::FloatLiteral:
    case NK::ImagLiteral:
    case NK::StringLiteral:
    case NK::BytesLiteral:
    case NK::BoolLiteral:
    case NK::NoneLiteral:
    case NK::EllipsisLiteral:
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
      break;
  }
  walkChildren(node, scope);
}

void StructuralExtractor::onCall(const ast::Call& call, const ScopeContext& scope) {
  out_.calls.add(scope.id(), CalleeDescriptor{CalleeKind::Call, ResolveName(call.callee.get())});
}

void StructuralExtractor::addFlow(CalleeKind kind, const ast::Expr* expr, const ScopeContext& scope) {
  out_.calls.add(scope.id(), CalleeDescriptor{kind, ResolveName(expr)});
}

}  // namespace pyscope::analysis
