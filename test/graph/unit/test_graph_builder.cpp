/***
 * Name: test_graph_builder
 * Purpose: Graph model construction: declaration nodes, placeholders,
 *   call and inheritance edges, id uniqueness and the report round trip.
 */
#include <gtest/gtest.h>

#include <cstddef>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "pyscope/graph/graph_builder.h"
#include "util/SourceFixtures.h"

using namespace pyscope;
using graph::EdgeKind;
using graph::NodeKind;

static graph::GraphModel buildFrom(const std::string& src) {
  graph::GraphModelBuilder builder;
  return builder.build(testutil::ExtractSource(src));
}

static NodeKind kindOf(const graph::GraphModel& g, const std::string& id) {
  const auto* node = g.findNode(id);
  EXPECT_NE(node, nullptr) << "missing node " << id;
  return node == nullptr ? NodeKind::External : node->kind;
}

TEST(GraphBuilder, InheritanceAndPlaceholderCallee) {
  const auto g = buildFrom("class A(B):\n    def m(self):\n        self.other()\n");
  EXPECT_EQ(kindOf(g, "m"), NodeKind::Module);
  EXPECT_EQ(kindOf(g, "m.A"), NodeKind::Class);
  EXPECT_EQ(kindOf(g, "m.A.m"), NodeKind::Method);
  EXPECT_EQ(kindOf(g, "m.B"), NodeKind::Base);
  EXPECT_EQ(kindOf(g, "self.other"), NodeKind::External);
  EXPECT_TRUE(g.hasEdge("m.B", "m.A", EdgeKind::Inherits));
  EXPECT_TRUE(g.hasEdge("m.A.m", "self.other", EdgeKind::Calls));
  EXPECT_TRUE(g.hasEdge("m", "m.A", EdgeKind::Contains));
  EXPECT_TRUE(g.hasEdge("m.A", "m.A.m", EdgeKind::ContainsMethod));
}

TEST(GraphBuilder, CallsResolveToDeclaredFunctionsAndMethods) {
  const auto g = buildFrom(
      "def helper():\n    pass\n"
      "class C:\n    def run(self):\n        helper()\n        other()\n"
      "    def other(self):\n        pass\n"
      "def main():\n    C()\n    run()\n");
  EXPECT_TRUE(g.hasEdge("m.C.run", "m.helper", EdgeKind::Calls));
  EXPECT_TRUE(g.hasEdge("m.C.run", "m.C.other", EdgeKind::Calls));
  EXPECT_TRUE(g.hasEdge("m.main", "m.C", EdgeKind::Calls));
  EXPECT_TRUE(g.hasEdge("m.main", "m.C.run", EdgeKind::Calls));
  EXPECT_FALSE(g.hasNode("helper"));
}

TEST(GraphBuilder, ModuleGroupsAndAttributes) {
  const auto g = buildFrom("import os\nX = 1\nclass K:\n    attr: int = 2\n");
  EXPECT_EQ(kindOf(g, "m.<globals>"), NodeKind::GlobalsGroup);
  EXPECT_EQ(kindOf(g, "m.<imports>"), NodeKind::ImportsGroup);
  EXPECT_EQ(kindOf(g, "m.K.attr"), NodeKind::Attribute);
  EXPECT_TRUE(g.hasEdge("m", "m.<globals>", EdgeKind::Defines));
  EXPECT_TRUE(g.hasEdge("m", "m.<imports>", EdgeKind::Imports));
  EXPECT_EQ(kindOf(g, "m.<globals>.X"), NodeKind::GlobalVariable);
  EXPECT_EQ(g.findNode("m.<globals>.X")->label, "Global: X = 1");
  EXPECT_TRUE(g.hasEdge("m.<globals>", "m.<globals>.X", EdgeKind::Defines));
  EXPECT_EQ(kindOf(g, "m.<imports>.import os"), NodeKind::Import);
  EXPECT_TRUE(g.hasEdge("m.<imports>", "m.<imports>.import os", EdgeKind::Imports));
  EXPECT_TRUE(g.hasEdge("m.K", "m.K.attr", EdgeKind::HasAttribute));
  EXPECT_EQ(g.findNode("m.K.attr")->label, "Attribute: attr: int = 2");
}

TEST(GraphBuilder, ControlFlowPlaceholders) {
  const auto g = buildFrom("def f(xs):\n    if ok:\n        pass\n    for x in xs:\n        pass\n");
  ASSERT_TRUE(g.hasNode("Condition: ok"));
  ASSERT_TRUE(g.hasNode("For Loop: xs"));
  EXPECT_EQ(g.findNode("Condition: ok")->kind, NodeKind::ControlFlow);
  EXPECT_EQ(g.findNode("Condition: ok")->flow, analysis::CalleeKind::Condition);
  EXPECT_TRUE(g.hasEdge("m.f", "For Loop: xs", EdgeKind::Calls));
}

TEST(GraphBuilder, ModuleLevelCallsComeFromModuleNode) {
  const auto g = buildFrom("def main():\n    pass\nmain()\nprint('x')\n");
  EXPECT_TRUE(g.hasEdge("m", "m.main", EdgeKind::Calls));
  EXPECT_TRUE(g.hasEdge("m", "print", EdgeKind::Calls));
}

TEST(GraphBuilder, NestedScopesGetMissingCallerNodes) {
  const auto g = buildFrom("def outer():\n    def inner():\n        work()\n");
  ASSERT_TRUE(g.hasNode("m.outer.inner"));
  EXPECT_EQ(g.findNode("m.outer.inner")->kind, NodeKind::MissingCaller);
  EXPECT_TRUE(g.hasEdge("m.outer.inner", "work", EdgeKind::Calls));
}

TEST(GraphBuilder, ExternalCalleeNamedLikeModuleKeepsItsEdge) {
  graph::GraphModelBuilder builder;
  const auto g = builder.build(testutil::ExtractSource("from app import main\nmain()\n", "main"));
  EXPECT_EQ(kindOf(g, "main"), NodeKind::Module);
  EXPECT_EQ(kindOf(g, "main#2"), NodeKind::External);
  EXPECT_EQ(g.findNode("main#2")->label, "main");
  EXPECT_TRUE(g.hasEdge("main", "main#2", EdgeKind::Calls));
}

TEST(GraphBuilder, MissingCallerDoesNotMergeIntoAttribute) {
  analysis::Structure s = testutil::ExtractSource("class A:\n    x = 1\n");
  s.calls.add("m.A.x", analysis::CalleeDescriptor{analysis::CalleeKind::Call, "work"});
  graph::GraphModelBuilder builder;
  const auto g = builder.build(s);
  EXPECT_EQ(kindOf(g, "m.A.x"), NodeKind::Attribute);
  EXPECT_EQ(kindOf(g, "m.A.x#2"), NodeKind::MissingCaller);
  EXPECT_TRUE(g.hasEdge("m.A.x#2", "work", EdgeKind::Calls));
  EXPECT_FALSE(g.hasEdge("m.A.x", "work", EdgeKind::Calls));
}

TEST(GraphBuilder, MethodSharingAttributeNameIsTheCaller) {
  const auto g = buildFrom("class A:\n    x = 1\n    def x(self):\n        work()\n");
  EXPECT_EQ(kindOf(g, "m.A.x"), NodeKind::Attribute);
  EXPECT_EQ(kindOf(g, "m.A.x#2"), NodeKind::Method);
  EXPECT_TRUE(g.hasEdge("m.A.x#2", "work", EdgeKind::Calls));
  EXPECT_FALSE(g.hasNode("m.A.x#3"));
}

TEST(GraphBuilder, BaseDefinedInModuleLinksToItsClass) {
  const auto g = buildFrom("class B:\n    pass\nclass A(B):\n    pass\n");
  EXPECT_EQ(kindOf(g, "m.B"), NodeKind::Class);
  EXPECT_FALSE(g.hasNode("m.B#2"));
  EXPECT_TRUE(g.hasEdge("m.B", "m.A", EdgeKind::Inherits));
}

TEST(GraphBuilder, RecursionDoesNotProduceSelfLoops) {
  const auto g = buildFrom("def f(n):\n    return f(n - 1)\n");
  for (const auto& edge : g.edges()) {
    EXPECT_NE(edge.from, edge.to);
  }
  EXPECT_FALSE(g.hasEdge("m.f", "m.f", EdgeKind::Calls));
}

TEST(GraphBuilder, DuplicateDeclarationsGetDistinctIds) {
  const auto g = buildFrom("def f():\n    pass\ndef f():\n    pass\nclass f:\n    pass\n");
  std::set<std::string> ids;
  for (const auto& node : g.nodes()) {
    EXPECT_TRUE(ids.insert(node.id).second) << "duplicate id " << node.id;
  }
  EXPECT_TRUE(g.hasNode("m.f"));
  EXPECT_TRUE(g.hasNode("m.f#2"));
  EXPECT_TRUE(g.hasNode("m.f#3"));
}

TEST(GraphBuilder, ClusterPerClass) {
  const auto g = buildFrom("@dataclass\nclass P(Base):\n    x: int\n");
  ASSERT_EQ(g.clusters.size(), 2u);
  EXPECT_FALSE(g.clusters[0].is_class);
  EXPECT_EQ(g.clusters[0].label, "Module: m");
  EXPECT_TRUE(g.clusters[1].is_class);
  EXPECT_EQ(g.clusters[1].label, "Decorators: dataclass\nClass: P(Base)");
  ASSERT_TRUE(g.findNode("m.P")->cluster.has_value());
  EXPECT_EQ(*g.findNode("m.P")->cluster, 1u);
  ASSERT_TRUE(g.findNode("m.P.x")->cluster.has_value());
  EXPECT_EQ(*g.findNode("m.P.x")->cluster, 1u);
  EXPECT_FALSE(g.findNode("m.Base")->cluster.has_value());
}

TEST(GraphBuilder, FunctionLabels) {
  analysis::FunctionRecord fn;
  fn.name = "f";
  fn.args = {"a", "b=2"};
  fn.return_annotation = "int";
  EXPECT_EQ(graph::FunctionLabel("Function", fn), "Function: f(\na, b=2) -> int");
  fn.decorators = {"cache", "wraps(...)"};
  EXPECT_EQ(graph::FunctionLabel("Method", fn), "Decorators: cache, wraps(...)\nMethod: f(\na, b=2) -> int");
}

TEST(GraphBuilder, EveryReportedEntityHasExactlyOneNode) {
  const auto s = testutil::ExtractSource(
      "import os\nimport os\nfrom a import b\nX = 1\nY: int = 2\n"
      "def foo():\n    bar()\n    if x:\n        pass\n"
      "class A(B):\n    y = 2\n    def m(self):\n        foo()\n");
  graph::GraphModelBuilder builder;
  const auto g = builder.build(s);
  const std::vector<std::pair<std::string, NodeKind>> reported{
      {"m", NodeKind::Module},
      {"m.<imports>.import os", NodeKind::Import},
      {"m.<imports>.from a import b", NodeKind::Import},
      {"m.<globals>.X", NodeKind::GlobalVariable},
      {"m.<globals>.Y", NodeKind::GlobalVariable},
      {"m.foo", NodeKind::Function},
      {"m.A", NodeKind::Class},
      {"m.A.y", NodeKind::Attribute},
      {"m.A.m", NodeKind::Method},
      {"bar", NodeKind::External},
  };
  for (const auto& [id, kind] : reported) {
    EXPECT_EQ(kindOf(g, id), kind) << id;
  }
  int declared = 0;
  for (const auto& node : g.nodes()) {
    switch (node.kind) {
      case NodeKind::Module:
      case NodeKind::GlobalVariable:
      case NodeKind::Import:
      case NodeKind::Class:
      case NodeKind::Function:
      case NodeKind::Method:
      case NodeKind::Attribute:
        ++declared;
        break;
      case NodeKind::GlobalsGroup:
      case NodeKind::ImportsGroup:
      case NodeKind::External:
      case NodeKind::Base:
      case NodeKind::MissingCaller:
      case NodeKind::ControlFlow:
        break;
    }
  }
  // the duplicated "import os" is reported once
  EXPECT_EQ(declared, 9);
  EXPECT_TRUE(g.hasNode("Condition: x"));
  EXPECT_TRUE(g.hasEdge("m.A.m", "m.foo", EdgeKind::Calls));
}

TEST(GraphBuilder, SameStructureBuildsEqualGraphs) {
  const std::string src = "class A(B):\n    def m(self):\n        f()\nf()\n";
  const auto a = buildFrom(src);
  const auto b = buildFrom(src);
  ASSERT_EQ(a.nodes().size(), b.nodes().size());
  for (std::size_t i = 0; i < a.nodes().size(); ++i) {
    EXPECT_EQ(a.nodes()[i].id, b.nodes()[i].id);
    EXPECT_EQ(a.nodes()[i].label, b.nodes()[i].label);
  }
  EXPECT_EQ(a.edges(), b.edges());
}
