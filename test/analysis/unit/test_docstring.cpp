/***
 * Name: test_docstring
 * Purpose: Docstring detection and cleandoc-style normalization.
 */
#include <gtest/gtest.h>

#include <string>

#include "ast/Nodes.h"
#include "pyscope/analysis/docstring.h"
#include "util/SourceFixtures.h"

using namespace pyscope;

TEST(Docstring, CleanDocRemovesCommonIndent) {
  EXPECT_EQ(analysis::CleanDoc("Summary.\n\n    Details here.\n      Indented more.\n    "),
            "Summary.\n\nDetails here.\n  Indented more.");
}

TEST(Docstring, CleanDocStripsLeadingBlankLines) {
  EXPECT_EQ(analysis::CleanDoc("\n\n   Title\n   body\n"), "Title\nbody");
}

TEST(Docstring, CleanDocExpandsTabs) {
  EXPECT_EQ(analysis::CleanDoc("T\n\tx\n\t  y"), "T\nx\n  y");
}

TEST(Docstring, FirstLine) {
  EXPECT_EQ(analysis::FirstLine("  One.\nTwo."), "One.");
  EXPECT_EQ(analysis::FirstLine("   "), "");
}

TEST(Docstring, OnlyLeadingStringCounts) {
  auto mod = testutil::ParseSource("def f():\n    x = 1\n    'not a doc'\n\ndef g():\n    '''Real.'''\n");
  const auto* f = static_cast<const ast::FunctionDef*>(mod->body[0].get());
  const auto* g = static_cast<const ast::FunctionDef*>(mod->body[1].get());
  EXPECT_FALSE(analysis::GetDocstring(f->body).has_value());
  ASSERT_TRUE(analysis::GetDocstring(g->body).has_value());
  EXPECT_EQ(*analysis::GetDocstring(g->body), "Real.");
}

TEST(Docstring, BytesAndFStringsAreNotDocstrings) {
  auto mod = testutil::ParseSource("def f():\n    b'x'\n\ndef g():\n    f'{x}'\n");
  const auto* f = static_cast<const ast::FunctionDef*>(mod->body[0].get());
  const auto* g = static_cast<const ast::FunctionDef*>(mod->body[1].get());
  EXPECT_FALSE(analysis::GetDocstring(f->body).has_value());
  EXPECT_FALSE(analysis::GetDocstring(g->body).has_value());
}
