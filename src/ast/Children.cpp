/***
 * Name: pyscope::ast::forEachChild
 * Purpose: Visit the direct children of a node in source order.
 * Inputs:
 *   - node: any AST node
 *   - fn: callback invoked for each non-null child
 * Outputs:
 *   - None
 * Theory of Operation:
 *   Each NodeKind maps to its concrete struct; children are reported in the
 *   order they appear in source. Decorators precede the definition they
 *   decorate, so they are reported first.
 */
#include "ast/Children.h"

#include <memory>
#include <vector>
#include "ast/Nodes.h"

namespace pyscope::ast {

namespace {

template <typename T>
void one(const std::unique_ptr<T>& child, const std::function<void(const Node&)>& fn) {
  if (child) { fn(*child); }
}

template <typename T>
void all(const std::vector<std::unique_ptr<T>>& children, const std::function<void(const Node&)>& fn) {
  for (const auto& child : children) { one(child, fn); }
}

void params(const std::vector<Param>& list, const std::function<void(const Node&)>& fn) {
  for (const auto& param : list) {
    one(param.annotation, fn);
    one(param.defaultValue, fn);
  }
}

void fors(const std::vector<ComprehensionFor>& list, const std::function<void(const Node&)>& fn) {
  for (const auto& gen : list) {
    one(gen.target, fn);
    one(gen.iter, fn);
    all(gen.ifs, fn);
  }
}

} // namespace

// NOLINTNEXTLINE(readability-function-size,readability-function-cognitive-complexity)
void forEachChild(const Node& node, const std::function<void(const Node&)>& fn) {
  switch (node.kind) {
    case NodeKind::Module:
      all(static_cast<const Module&>(node).body, fn);
      return;
    case NodeKind::FunctionDef: {
      const auto& def = static_cast<const FunctionDef&>(node);
      all(def.decorators, fn);
      params(def.params, fn);
      one(def.returns, fn);
      all(def.body, fn);
      return;
    }
    case NodeKind::ClassDef: {
      const auto& cls = static_cast<const ClassDef&>(node);
      all(cls.decorators, fn);
      all(cls.bases, fn);
      for (const auto& kw : cls.keywords) { one(kw.value, fn); }
      all(cls.body, fn);
      return;
    }
    case NodeKind::ReturnStmt:
      one(static_cast<const ReturnStmt&>(node).value, fn);
      return;
    case NodeKind::AssignStmt: {
      const auto& asg = static_cast<const AssignStmt&>(node);
      all(asg.targets, fn);
      one(asg.value, fn);
      return;
    }
    case NodeKind::AugAssignStmt: {
      const auto& asg = static_cast<const AugAssignStmt&>(node);
      one(asg.target, fn);
      one(asg.value, fn);
      return;
    }
    case NodeKind::AnnAssignStmt: {
      const auto& asg = static_cast<const AnnAssignStmt&>(node);
      one(asg.target, fn);
      one(asg.annotation, fn);
      one(asg.value, fn);
      return;
    }
    case NodeKind::ExprStmt:
      one(static_cast<const ExprStmt&>(node).value, fn);
      return;
    case NodeKind::IfStmt: {
      const auto& stmt = static_cast<const IfStmt&>(node);
      one(stmt.cond, fn);
      all(stmt.thenBody, fn);
      all(stmt.elseBody, fn);
      return;
    }
    case NodeKind::WhileStmt: {
      const auto& stmt = static_cast<const WhileStmt&>(node);
      one(stmt.cond, fn);
      all(stmt.thenBody, fn);
      all(stmt.elseBody, fn);
      return;
    }
    case NodeKind::ForStmt: {
      const auto& stmt = static_cast<const ForStmt&>(node);
      one(stmt.target, fn);
      one(stmt.iterable, fn);
      all(stmt.thenBody, fn);
      all(stmt.elseBody, fn);
      return;
    }
    case NodeKind::TryStmt: {
      const auto& stmt = static_cast<const TryStmt&>(node);
      all(stmt.body, fn);
      all(stmt.handlers, fn);
      all(stmt.orelse, fn);
      all(stmt.finalbody, fn);
      return;
    }
    case NodeKind::ExceptHandler: {
      const auto& handler = static_cast<const ExceptHandler&>(node);
      one(handler.type, fn);
      all(handler.body, fn);
      return;
    }
    case NodeKind::WithStmt: {
      const auto& stmt = static_cast<const WithStmt&>(node);
      all(stmt.items, fn);
      all(stmt.body, fn);
      return;
    }
    case NodeKind::WithItem: {
      const auto& item = static_cast<const WithItem&>(node);
      one(item.context, fn);
      one(item.optionalVars, fn);
      return;
    }
    case NodeKind::RaiseStmt: {
      const auto& stmt = static_cast<const RaiseStmt&>(node);
      one(stmt.exc, fn);
      one(stmt.cause, fn);
      return;
    }
    case NodeKind::AssertStmt: {
      const auto& stmt = static_cast<const AssertStmt&>(node);
      one(stmt.test, fn);
      one(stmt.msg, fn);
      return;
    }
    case NodeKind::DelStmt:
      all(static_cast<const DelStmt&>(node).targets, fn);
      return;
    case NodeKind::MatchStmt: {
      const auto& stmt = static_cast<const MatchStmt&>(node);
      one(stmt.subject, fn);
      all(stmt.cases, fn);
      return;
    }
    case NodeKind::MatchCase: {
      const auto& mc = static_cast<const MatchCase&>(node);
      one(mc.pattern, fn);
      one(mc.guard, fn);
      all(mc.body, fn);
      return;
    }
    case NodeKind::Import:
    case NodeKind::ImportFrom:
    case NodeKind::GlobalStmt:
    case NodeKind::NonlocalStmt:
    case NodeKind::PassStmt:
    case NodeKind::BreakStmt:
    case NodeKind::ContinueStmt:
      return;

    case NodeKind::Name:
      return;
    case NodeKind::Attribute:
      one(static_cast<const Attribute&>(node).value, fn);
      return;
    case NodeKind::Call: {
      const auto& call = static_cast<const Call&>(node);
      one(call.callee, fn);
      all(call.args, fn);
      for (const auto& kw : call.keywords) { one(kw.value, fn); }
      all(call.starArgs, fn);
      all(call.kwStarArgs, fn);
      return;
    }
    case NodeKind::Subscript: {
      const auto& sub = static_cast<const Subscript&>(node);
      one(sub.value, fn);
      one(sub.slice, fn);
      return;
    }
    case NodeKind::Slice: {
      const auto& slice = static_cast<const Slice&>(node);
      one(slice.lower, fn);
      one(slice.upper, fn);
      one(slice.step, fn);
      return;
    }
    case NodeKind::Starred:
      one(static_cast<const Starred&>(node).value, fn);
      return;
    case NodeKind::IntLiteral:
    case NodeKind::FloatLiteral:
    case NodeKind::ImagLiteral:
    case NodeKind::StringLiteral:
    case NodeKind::BytesLiteral:
    case NodeKind::BoolLiteral:
    case NodeKind::NoneLiteral:
    case NodeKind::EllipsisLiteral:
      return;
    case NodeKind::FStringLiteral:
      for (const auto& seg : static_cast<const FStringLiteral&>(node).parts) { one(seg.expr, fn); }
      return;
    case NodeKind::BinaryExpr: {
      const auto& bin = static_cast<const Binary&>(node);
      one(bin.lhs, fn);
      one(bin.rhs, fn);
      return;
    }
    case NodeKind::UnaryExpr:
      one(static_cast<const Unary&>(node).operand, fn);
      return;
    case NodeKind::Compare: {
      const auto& cmp = static_cast<const Compare&>(node);
      one(cmp.left, fn);
      all(cmp.comparators, fn);
      return;
    }
    case NodeKind::IfExpr: {
      // source order: body if test else orelse
      const auto& ife = static_cast<const IfExpr&>(node);
      one(ife.body, fn);
      one(ife.test, fn);
      one(ife.orelse, fn);
      return;
    }
    case NodeKind::LambdaExpr: {
      const auto& lam = static_cast<const LambdaExpr&>(node);
      params(lam.params, fn);
      one(lam.body, fn);
      return;
    }
    case NodeKind::NamedExpr:
      one(static_cast<const NamedExpr&>(node).value, fn);
      return;
    case NodeKind::TupleLiteral:
      all(static_cast<const TupleLiteral&>(node).elements, fn);
      return;
    case NodeKind::ListLiteral:
      all(static_cast<const ListLiteral&>(node).elements, fn);
      return;
    case NodeKind::SetLiteral:
      all(static_cast<const SetLiteral&>(node).elements, fn);
      return;
    case NodeKind::DictLiteral: {
      const auto& dict = static_cast<const DictLiteral&>(node);
      for (const auto& [key, value] : dict.items) {
        one(key, fn);
        one(value, fn);
      }
      all(dict.unpacks, fn);
      return;
    }
    case NodeKind::ListComp: {
      const auto& comp = static_cast<const ListComp&>(node);
      one(comp.elt, fn);
      fors(comp.fors, fn);
      return;
    }
    case NodeKind::SetComp: {
      const auto& comp = static_cast<const SetComp&>(node);
      one(comp.elt, fn);
      fors(comp.fors, fn);
      return;
    }
    case NodeKind::DictComp: {
      const auto& comp = static_cast<const DictComp&>(node);
      one(comp.key, fn);
      one(comp.value, fn);
      fors(comp.fors, fn);
      return;
    }
    case NodeKind::GeneratorExpr: {
      const auto& comp = static_cast<const GeneratorExpr&>(node);
      one(comp.elt, fn);
      fors(comp.fors, fn);
      return;
    }
    case NodeKind::YieldExpr:
      one(static_cast<const YieldExpr&>(node).value, fn);
      return;
    case NodeKind::AwaitExpr:
      one(static_cast<const AwaitExpr&>(node).value, fn);
      return;

    case NodeKind::PatternWildcard:
    case NodeKind::PatternName:
    case NodeKind::PatternStar:
      return;
    case NodeKind::PatternLiteral:
      one(static_cast<const PatternLiteral&>(node).value, fn);
      return;
    case NodeKind::PatternOr:
      all(static_cast<const PatternOr&>(node).patterns, fn);
      return;
    case NodeKind::PatternAs:
      one(static_cast<const PatternAs&>(node).pattern, fn);
      return;
    case NodeKind::PatternClass: {
      const auto& pat = static_cast<const PatternClass&>(node);
      one(pat.cls, fn);
      all(pat.args, fn);
      for (const auto& [name, sub] : pat.kwargs) { one(sub, fn); }
      return;
    }
    case NodeKind::PatternSequence:
      all(static_cast<const PatternSequence&>(node).elements, fn);
      return;
    case NodeKind::PatternMapping: {
      const auto& pat = static_cast<const PatternMapping&>(node);
      for (const auto& [key, sub] : pat.items) {
        one(key, fn);
        one(sub, fn);
      }
      return;
    }
  }
}

} // namespace pyscope::ast
