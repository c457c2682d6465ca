/**
 * @file
 * @brief AST structural pattern declarations.
 */
#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "ast/Expr.h"
#include "ast/Node.h"

namespace pyscope::ast {

struct Pattern : Node { using Node::Node; };

struct PatternWildcard final : Pattern {
  PatternWildcard() : Pattern(NodeKind::PatternWildcard) {}
};

struct PatternName final : Pattern {
  std::string name;
  explicit PatternName(std::string n) : Pattern(NodeKind::PatternName), name(std::move(n)) {}
};

// Literal or dotted value pattern (1, "x", None, Color.RED)
struct PatternLiteral final : Pattern {
  std::unique_ptr<Expr> value;
  explicit PatternLiteral(std::unique_ptr<Expr> v)
      : Pattern(NodeKind::PatternLiteral), value(std::move(v)) {}
};

struct PatternOr final : Pattern {
  std::vector<std::unique_ptr<Pattern>> patterns;
  PatternOr() : Pattern(NodeKind::PatternOr) {}
};

struct PatternAs final : Pattern {
  std::unique_ptr<Pattern> pattern;
  std::string name;
  PatternAs(std::unique_ptr<Pattern> p, std::string n)
      : Pattern(NodeKind::PatternAs), pattern(std::move(p)), name(std::move(n)) {}
};

struct PatternClass final : Pattern {
  std::unique_ptr<Expr> cls; // Name or Attribute
  std::vector<std::unique_ptr<Pattern>> args;
  std::vector<std::pair<std::string, std::unique_ptr<Pattern>>> kwargs;
  explicit PatternClass(std::unique_ptr<Expr> c)
      : Pattern(NodeKind::PatternClass), cls(std::move(c)) {}
};

struct PatternSequence final : Pattern {
  bool isList{true}; // true: [], false: ()
  std::vector<std::unique_ptr<Pattern>> elements;
  PatternSequence() : Pattern(NodeKind::PatternSequence) {}
};

struct PatternMapping final : Pattern {
  std::vector<std::pair<std::unique_ptr<Expr>, std::unique_ptr<Pattern>>> items;
  bool hasRest{false};
  std::string restName; // valid if hasRest
  PatternMapping() : Pattern(NodeKind::PatternMapping) {}
};

struct PatternStar final : Pattern {
  std::string name; // may be "_" to discard
  explicit PatternStar(std::string n) : Pattern(NodeKind::PatternStar), name(std::move(n)) {}
};

} // namespace pyscope::ast
