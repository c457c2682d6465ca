/***
 * Name: test_extractor
 * Purpose: Structure extraction: functions, classes, methods, variables,
 *   imports and per-scope call sets.
 */
#include <gtest/gtest.h>

#include <string>

#include "pyscope/analysis/model.h"
#include "util/SourceFixtures.h"

using namespace pyscope;
using analysis::CalleeDescriptor;
using analysis::CalleeKind;

static bool hasCallee(const analysis::Structure& s, const std::string& scope, const CalleeDescriptor& d) {
  const auto* set = s.calls.find(scope);
  return set != nullptr && set->count(d) != 0U;
}

TEST(Extractor, FunctionWithDefaultAndCall) {
  const auto s = testutil::ExtractSource("def foo(a, b=2):\n    return bar()\n");
  EXPECT_EQ(s.module_name, "m");
  ASSERT_EQ(s.functions.size(), 1u);
  EXPECT_EQ(s.functions[0].name, "foo");
  EXPECT_EQ(s.functions[0].args, (std::vector<std::string>{"a", "b=2"}));
  EXPECT_FALSE(s.functions[0].docstring.has_value());
  const auto* calls = s.calls.find("m.foo");
  ASSERT_NE(calls, nullptr);
  EXPECT_EQ(*calls, (analysis::CallGraph::CalleeSet{CalleeDescriptor{CalleeKind::Call, "bar"}}));
}

TEST(Extractor, ClassWithBaseAndMethodCall) {
  const auto s = testutil::ExtractSource("class A(B):\n    def m(self):\n        self.other()\n");
  ASSERT_EQ(s.classes.size(), 1u);
  const auto& cls = s.classes[0];
  EXPECT_EQ(cls.bases, (std::vector<std::string>{"B"}));
  ASSERT_EQ(cls.methods.size(), 1u);
  EXPECT_EQ(cls.methods[0].name, "m");
  EXPECT_EQ(cls.methods[0].args, (std::vector<std::string>{"self"}));
  EXPECT_TRUE(s.functions.empty());
  EXPECT_TRUE(hasCallee(s, "m.A.m", CalleeDescriptor{CalleeKind::Call, "self.other"}));
}

TEST(Extractor, ArgumentFormatting) {
  const auto s = testutil::ExtractSource("def f(a: int, b: str = 'x', *args, c=None, **kw) -> dict:\n    pass\n");
  ASSERT_EQ(s.functions.size(), 1u);
  EXPECT_EQ(s.functions[0].args,
            (std::vector<std::string>{"a: int", "b: str='x'", "c=None"}));
  ASSERT_TRUE(s.functions[0].return_annotation.has_value());
  EXPECT_EQ(*s.functions[0].return_annotation, "dict");
}

TEST(Extractor, VariadicParametersTakeNoSlot) {
  const auto s = testutil::ExtractSource("def f(a, /, b=1, *args, c, d=2, **kw):\n    pass\n");
  ASSERT_EQ(s.functions.size(), 1u);
  EXPECT_EQ(s.functions[0].args, (std::vector<std::string>{"a", "b=1", "c", "d=2"}));
}

TEST(Extractor, StatementsSpanningLines) {
  const auto s = testutil::ExtractSource(
      "import os, \\\n    sys\n"
      "class Config(\n    Base,\n):\n"
      "    def load(self,\n             path,\n             *,\n             strict=True):\n"
      "        return parse(\n            path,\n        )\n");
  EXPECT_EQ(s.imports.direct, (std::vector<std::string>{"os", "sys"}));
  ASSERT_EQ(s.classes.size(), 1u);
  EXPECT_EQ(s.classes[0].bases, (std::vector<std::string>{"Base"}));
  ASSERT_EQ(s.classes[0].methods.size(), 1u);
  EXPECT_EQ(s.classes[0].methods[0].args, (std::vector<std::string>{"self", "path", "strict=True"}));
  const auto* calls = s.calls.find("m.Config.load");
  ASSERT_NE(calls, nullptr);
  EXPECT_EQ(calls->size(), 1u);
}

TEST(Extractor, DecoratorsAndAsync) {
  const auto s = testutil::ExtractSource("@functools.wraps(g)\n@staticmethod\nasync def f():\n    pass\n");
  ASSERT_EQ(s.functions.size(), 1u);
  EXPECT_TRUE(s.functions[0].is_async);
  EXPECT_EQ(s.functions[0].decorators, (std::vector<std::string>{"functools.wraps(...)", "staticmethod"}));
}

TEST(Extractor, MethodsInSourceOrderAndNestedFunctions) {
  const auto s = testutil::ExtractSource(
      "class C:\n"
      "    def b(self):\n"
      "        def helper():\n"
      "            pass\n"
      "    def a(self):\n"
      "        pass\n");
  ASSERT_EQ(s.classes.size(), 1u);
  ASSERT_EQ(s.classes[0].methods.size(), 2u);
  EXPECT_EQ(s.classes[0].methods[0].name, "b");
  EXPECT_EQ(s.classes[0].methods[1].name, "a");
  // innermost scope of helper is "b", not a class
  ASSERT_EQ(s.functions.size(), 1u);
  EXPECT_EQ(s.functions[0].name, "helper");
}

TEST(Extractor, NestedClassesAreRecorded) {
  const auto s = testutil::ExtractSource("class Outer:\n    class Inner:\n        def m(self):\n            pass\n");
  ASSERT_EQ(s.classes.size(), 2u);
  EXPECT_EQ(s.classes[0].name, "Outer");
  EXPECT_EQ(s.classes[1].name, "Inner");
  ASSERT_EQ(s.classes[1].methods.size(), 1u);
  EXPECT_TRUE(s.classes[0].methods.empty());
}

TEST(Extractor, GlobalVariablesAndClassAttributes) {
  const auto s = testutil::ExtractSource(
      "X = 1\n"
      "Y: int = 2\n"
      "Z: str\n"
      "a = b = f()\n"
      "t, u = 1, 2\n"
      "class K:\n"
      "    attr = 'v'\n"
      "    typed: float\n"
      "    def m(self):\n"
      "        local = 3\n");
  ASSERT_EQ(s.global_variables.size(), 5u);
  EXPECT_EQ(s.global_variables[0], (analysis::Variable{"X", std::nullopt, std::string("1")}));
  EXPECT_EQ(s.global_variables[1], (analysis::Variable{"Y", std::string("int"), std::string("2")}));
  EXPECT_EQ(s.global_variables[2], (analysis::Variable{"Z", std::string("str"), std::nullopt}));
  EXPECT_EQ(s.global_variables[3].name, "a");
  EXPECT_EQ(s.global_variables[4].name, "b");
  EXPECT_EQ(*s.global_variables[4].value, "f(...)");
  ASSERT_EQ(s.classes[0].attributes.size(), 2u);
  EXPECT_EQ(s.classes[0].attributes[0].name, "attr");
  EXPECT_EQ(*s.classes[0].attributes[0].value, "'v'");
  EXPECT_EQ(s.classes[0].attributes[1].name, "typed");
}

TEST(Extractor, LocalOfFunctionNamedLikeClassBecomesAttribute) {
  const auto s = testutil::ExtractSource(
      "class Config:\n"
      "    pass\n"
      "def Config2():\n"
      "    pass\n"
      "def outer():\n"
      "    def Config():\n"
      "        leaked = 1\n");
  ASSERT_EQ(s.classes.size(), 1u);
  ASSERT_EQ(s.classes[0].attributes.size(), 1u);
  EXPECT_EQ(s.classes[0].attributes[0].name, "leaked");
}

TEST(Extractor, ImportsDirectAndFrom) {
  const auto s = testutil::ExtractSource(
      "import os, os.path as osp\n"
      "from collections import OrderedDict, deque as dq\n"
      "from . import sibling\n"
      "def f():\n"
      "    import json\n");
  EXPECT_EQ(s.imports.direct, (std::vector<std::string>{"os", "os.path", "json"}));
  EXPECT_EQ(s.imports.from,
            (std::vector<std::string>{"collections.OrderedDict", "collections.deque", "sibling"}));
}

TEST(Extractor, ControlFlowRecordsSyntheticCallees) {
  const auto s = testutil::ExtractSource(
      "def f(items):\n"
      "    if ready:\n"
      "        go()\n"
      "    for i in items:\n"
      "        pass\n"
      "    while self.running:\n"
      "        pass\n");
  EXPECT_TRUE(hasCallee(s, "m.f", CalleeDescriptor{CalleeKind::Condition, "ready"}));
  EXPECT_TRUE(hasCallee(s, "m.f", CalleeDescriptor{CalleeKind::ForLoop, "items"}));
  EXPECT_TRUE(hasCallee(s, "m.f", CalleeDescriptor{CalleeKind::WhileLoop, "self.running"}));
  EXPECT_TRUE(hasCallee(s, "m.f", CalleeDescriptor{CalleeKind::Call, "go"}));
  EXPECT_EQ(s.calls.find("m.f")->size(), 4u);
}

TEST(Extractor, ModuleLevelCallsUseModuleScope) {
  const auto s = testutil::ExtractSource("main()\nif __name__ == '__main__':\n    run()\n");
  EXPECT_TRUE(hasCallee(s, "m", CalleeDescriptor{CalleeKind::Call, "main"}));
  EXPECT_TRUE(hasCallee(s, "m", CalleeDescriptor{CalleeKind::Call, "run"}));
  EXPECT_TRUE(hasCallee(s, "m", CalleeDescriptor{CalleeKind::Condition, "<?>"}));
}

TEST(Extractor, CallsAreDeduplicatedPerScope) {
  const auto s = testutil::ExtractSource("def f():\n    g()\n    g()\n    g(1)\n");
  EXPECT_EQ(s.calls.find("m.f")->size(), 1u);
  EXPECT_EQ(s.calls.edgeCount(), 1u);
}

TEST(Extractor, CallsInsideArgumentsAndDecorators) {
  const auto s = testutil::ExtractSource("@register(make())\ndef f(x=default()):\n    outer(inner())\n");
  EXPECT_TRUE(hasCallee(s, "m.f", CalleeDescriptor{CalleeKind::Call, "outer"}));
  EXPECT_TRUE(hasCallee(s, "m.f", CalleeDescriptor{CalleeKind::Call, "inner"}));
  // decorators and defaults are visited inside the function's own scope
  EXPECT_TRUE(hasCallee(s, "m.f", CalleeDescriptor{CalleeKind::Call, "register"}));
  EXPECT_TRUE(hasCallee(s, "m.f", CalleeDescriptor{CalleeKind::Call, "default"}));
  EXPECT_EQ(s.calls.find("m"), nullptr);
}

TEST(Extractor, DocstringsOfFunctionsAndClasses) {
  const auto s = testutil::ExtractSource(
      "class A:\n    \"\"\"Class doc.\n\n    More.\n    \"\"\"\n    def m(self):\n        'Method doc.'\n");
  ASSERT_TRUE(s.classes[0].docstring.has_value());
  EXPECT_EQ(*s.classes[0].docstring, "Class doc.\n\nMore.");
  ASSERT_TRUE(s.classes[0].methods[0].docstring.has_value());
  EXPECT_EQ(*s.classes[0].methods[0].docstring, "Method doc.");
}

TEST(Extractor, SameInputYieldsEqualStructures) {
  const std::string src = "import a\nclass A(B):\n    x = 1\n    def m(self):\n        f()\nf()\n";
  EXPECT_EQ(testutil::ExtractSource(src), testutil::ExtractSource(src));
}

TEST(Extractor, EmptyModule) {
  const auto s = testutil::ExtractSource("");
  EXPECT_TRUE(s.functions.empty());
  EXPECT_TRUE(s.classes.empty());
  EXPECT_TRUE(s.global_variables.empty());
  EXPECT_EQ(s.calls.edgeCount(), 0u);
}
