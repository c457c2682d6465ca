/***
 * Name: test_parser_module_shapes
 * Purpose: Module-level statements parse into the expected node shapes.
 */
#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "ast/Nodes.h"
#include "lexer/Lexer.h"
#include "parser/Parser.h"

using namespace pyscope;

static std::unique_ptr<ast::Module> parseSrc(const std::string& src) {
  lex::Lexer L;
  L.pushString(src, "shapes.py");
  parse::Parser P(L);
  P.setSourceText("shapes.py", src);
  return P.parseModule();
}

TEST(ParserModuleShapes, FunctionWithDefaultsAndAnnotations) {
  auto mod = parseSrc("def foo(a, b: int = 2, *args, c, **kw) -> list[int]:\n    return bar()\n");
  ASSERT_EQ(mod->body.size(), 1u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::FunctionDef);
  const auto* fn = static_cast<const ast::FunctionDef*>(mod->body[0].get());
  EXPECT_EQ(fn->name, "foo");
  ASSERT_EQ(fn->params.size(), 5u);
  EXPECT_EQ(fn->params[1].name, "b");
  ASSERT_TRUE(fn->params[1].annotation);
  ASSERT_TRUE(fn->params[1].defaultValue);
  EXPECT_TRUE(fn->params[2].isVarArg);
  EXPECT_TRUE(fn->params[3].isKwOnly);
  EXPECT_TRUE(fn->params[4].isKwVarArg);
  ASSERT_TRUE(fn->returns);
  EXPECT_EQ(fn->returns->kind, ast::NodeKind::Subscript);
  ASSERT_EQ(fn->body.size(), 1u);
  EXPECT_EQ(fn->body[0]->kind, ast::NodeKind::ReturnStmt);
}

TEST(ParserModuleShapes, DecoratedAsyncDef) {
  auto mod = parseSrc("@app.route('/x')\n@cache\nasync def handler(req):\n    await work(req)\n");
  ASSERT_EQ(mod->body.size(), 1u);
  const auto* fn = static_cast<const ast::FunctionDef*>(mod->body[0].get());
  EXPECT_TRUE(fn->isAsync);
  ASSERT_EQ(fn->decorators.size(), 2u);
  EXPECT_EQ(fn->decorators[0]->kind, ast::NodeKind::Call);
  EXPECT_EQ(fn->decorators[1]->kind, ast::NodeKind::Name);
}

TEST(ParserModuleShapes, ClassWithBasesAndKeywords) {
  auto mod = parseSrc("class A(B, mod.C, metaclass=Meta):\n    x = 1\n    def m(self):\n        pass\n");
  const auto* cls = static_cast<const ast::ClassDef*>(mod->body[0].get());
  EXPECT_EQ(cls->name, "A");
  ASSERT_EQ(cls->bases.size(), 2u);
  EXPECT_EQ(cls->bases[1]->kind, ast::NodeKind::Attribute);
  ASSERT_EQ(cls->keywords.size(), 1u);
  EXPECT_EQ(cls->keywords[0].name, "metaclass");
  ASSERT_EQ(cls->body.size(), 2u);
  EXPECT_EQ(cls->body[0]->kind, ast::NodeKind::AssignStmt);
  EXPECT_EQ(cls->body[1]->kind, ast::NodeKind::FunctionDef);
}

TEST(ParserModuleShapes, ChainedAndAnnotatedAssignment) {
  auto mod = parseSrc("a = b = 1\nc: int\nd: str = 'x'\ne += 2\nf, *g = h\n");
  ASSERT_EQ(mod->body.size(), 5u);
  const auto* chained = static_cast<const ast::AssignStmt*>(mod->body[0].get());
  EXPECT_EQ(chained->targets.size(), 2u);
  const auto* bare = static_cast<const ast::AnnAssignStmt*>(mod->body[1].get());
  EXPECT_FALSE(bare->value);
  const auto* valued = static_cast<const ast::AnnAssignStmt*>(mod->body[2].get());
  EXPECT_TRUE(valued->value);
  EXPECT_EQ(mod->body[3]->kind, ast::NodeKind::AugAssignStmt);
  const auto* unpack = static_cast<const ast::AssignStmt*>(mod->body[4].get());
  ASSERT_EQ(unpack->targets.size(), 1u);
  EXPECT_EQ(unpack->targets[0]->kind, ast::NodeKind::TupleLiteral);
}

TEST(ParserModuleShapes, ImportForms) {
  auto mod = parseSrc("import os.path as p, sys\nfrom . import x\nfrom ..pkg import (a as b,\n    c)\nfrom m import *\n");
  ASSERT_EQ(mod->body.size(), 4u);
  const auto* imp = static_cast<const ast::Import*>(mod->body[0].get());
  ASSERT_EQ(imp->names.size(), 2u);
  EXPECT_EQ(imp->names[0].name, "os.path");
  EXPECT_EQ(imp->names[0].asname, "p");
  const auto* rel = static_cast<const ast::ImportFrom*>(mod->body[1].get());
  EXPECT_EQ(rel->level, 1);
  EXPECT_TRUE(rel->module.empty());
  const auto* paren = static_cast<const ast::ImportFrom*>(mod->body[2].get());
  EXPECT_EQ(paren->level, 2);
  EXPECT_EQ(paren->module, "pkg");
  EXPECT_EQ(paren->names.size(), 2u);
  const auto* star = static_cast<const ast::ImportFrom*>(mod->body[3].get());
  ASSERT_EQ(star->names.size(), 1u);
  EXPECT_EQ(star->names[0].name, "*");
}

TEST(ParserModuleShapes, ControlFlowAndElifNesting) {
  auto mod = parseSrc(
      "if a:\n    pass\nelif b:\n    pass\nelse:\n    pass\n"
      "for i in range(3):\n    continue\nelse:\n    pass\n"
      "while x: break\n"
      "try:\n    pass\nexcept (E, F) as e:\n    raise G from e\nfinally:\n    pass\n"
      "with open(p) as f, lock:\n    pass\n");
  ASSERT_EQ(mod->body.size(), 5u);
  const auto* ifs = static_cast<const ast::IfStmt*>(mod->body[0].get());
  ASSERT_EQ(ifs->elseBody.size(), 1u);
  EXPECT_EQ(ifs->elseBody[0]->kind, ast::NodeKind::IfStmt);
  const auto* loop = static_cast<const ast::ForStmt*>(mod->body[1].get());
  EXPECT_EQ(loop->elseBody.size(), 1u);
  EXPECT_EQ(mod->body[2]->kind, ast::NodeKind::WhileStmt);
  const auto* tr = static_cast<const ast::TryStmt*>(mod->body[3].get());
  EXPECT_EQ(tr->handlers.size(), 1u);
  EXPECT_EQ(tr->finalbody.size(), 1u);
  const auto* with = static_cast<const ast::WithStmt*>(mod->body[4].get());
  EXPECT_EQ(with->items.size(), 2u);
}

TEST(ParserModuleShapes, SimpleStatementsSeparatedBySemicolons) {
  auto mod = parseSrc("x = 1; y = 2; print(x)\n");
  ASSERT_EQ(mod->body.size(), 3u);
  EXPECT_EQ(mod->body[2]->kind, ast::NodeKind::ExprStmt);
}

TEST(ParserModuleShapes, MatchStatementWithPatterns) {
  auto mod = parseSrc(
      "match cmd:\n"
      "    case ['go', direction]:\n        pass\n"
      "    case {'k': v, **rest}:\n        pass\n"
      "    case Point(x=0) | None:\n        pass\n"
      "    case _ if flag:\n        pass\n");
  ASSERT_EQ(mod->body.size(), 1u);
  ASSERT_EQ(mod->body[0]->kind, ast::NodeKind::MatchStmt);
  const auto* match = static_cast<const ast::MatchStmt*>(mod->body[0].get());
  ASSERT_EQ(match->cases.size(), 4u);
  EXPECT_TRUE(match->cases[3]->guard);
}

TEST(ParserModuleShapes, MatchAsPlainIdentifier) {
  auto mod = parseSrc("match = re.match(p, s)\nmatch.group(0)\n");
  ASSERT_EQ(mod->body.size(), 2u);
  EXPECT_EQ(mod->body[0]->kind, ast::NodeKind::AssignStmt);
  EXPECT_EQ(mod->body[1]->kind, ast::NodeKind::ExprStmt);
}

TEST(ParserModuleShapes, ExpressionsOfEveryPrecedenceLevel) {
  auto mod = parseSrc(
      "r = lambda a, *b: a if not b else -a ** 2 @ m | n ^ o & p << 1 // 3 % 4\n"
      "s = [x for x in xs if x > 0 < y]\n"
      "t = {k: v for k, v in d.items()}\n"
      "u = {*a, *b}\n"
      "v = {**d, 'k': 1}\n"
      "w = (y := f(*args, key=1, **kw))\n"
      "z = obj.attr[1:2, ::3](...)\n");
  ASSERT_EQ(mod->body.size(), 7u);
  const auto* first = static_cast<const ast::AssignStmt*>(mod->body[0].get());
  EXPECT_EQ(first->value->kind, ast::NodeKind::LambdaExpr);
  const auto* comp = static_cast<const ast::AssignStmt*>(mod->body[1].get());
  EXPECT_EQ(comp->value->kind, ast::NodeKind::ListComp);
  const auto* dict = static_cast<const ast::AssignStmt*>(mod->body[2].get());
  EXPECT_EQ(dict->value->kind, ast::NodeKind::DictComp);
  const auto* set = static_cast<const ast::AssignStmt*>(mod->body[3].get());
  EXPECT_EQ(set->value->kind, ast::NodeKind::SetLiteral);
  const auto* walrus = static_cast<const ast::AssignStmt*>(mod->body[5].get());
  EXPECT_EQ(walrus->value->kind, ast::NodeKind::NamedExpr);
  const auto* call = static_cast<const ast::AssignStmt*>(mod->body[6].get());
  EXPECT_EQ(call->value->kind, ast::NodeKind::Call);
}

TEST(ParserModuleShapes, StringConcatenationAndFStrings) {
  auto mod = parseSrc("a = 'x' \"y\"\nb = f'{name!r:>10} and {x + 1}'\nc = b'\\x00'\n");
  const auto* concat = static_cast<const ast::AssignStmt*>(mod->body[0].get());
  ASSERT_EQ(concat->value->kind, ast::NodeKind::StringLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral*>(concat->value.get())->value, "xy");
  const auto* fstr = static_cast<const ast::AssignStmt*>(mod->body[1].get());
  ASSERT_EQ(fstr->value->kind, ast::NodeKind::FStringLiteral);
  const auto* parts = static_cast<const ast::FStringLiteral*>(fstr->value.get());
  int exprs = 0;
  for (const auto& part : parts->parts) { if (part.isExpr) ++exprs; }
  EXPECT_EQ(exprs, 2);
  const auto* bytes = static_cast<const ast::AssignStmt*>(mod->body[2].get());
  EXPECT_EQ(bytes->value->kind, ast::NodeKind::BytesLiteral);
}

TEST(ParserModuleShapes, DocstringIsLeadingExpressionStatement) {
  auto mod = parseSrc("def f():\n    \"\"\"Doc.\"\"\"\n    return 1\n");
  const auto* fn = static_cast<const ast::FunctionDef*>(mod->body[0].get());
  ASSERT_EQ(fn->body[0]->kind, ast::NodeKind::ExprStmt);
  const auto* stmt = static_cast<const ast::ExprStmt*>(fn->body[0].get());
  ASSERT_EQ(stmt->value->kind, ast::NodeKind::StringLiteral);
  EXPECT_EQ(static_cast<const ast::StringLiteral*>(stmt->value.get())->value, "Doc.");
}

TEST(ParserModuleShapes, NodesCarryLocations) {
  auto mod = parseSrc("x = 1\n\ndef g():\n    pass\n");
  ASSERT_EQ(mod->body.size(), 2u);
  EXPECT_EQ(mod->body[1]->line, 3);
  EXPECT_EQ(mod->body[1]->col, 1);
  EXPECT_EQ(mod->body[1]->file, "shapes.py");
}
