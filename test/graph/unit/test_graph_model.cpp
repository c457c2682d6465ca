/***
 * Name: test_graph_model
 * Purpose: Node id uniqueness and edge filtering in GraphModel.
 */
#include <gtest/gtest.h>

#include "pyscope/graph/graph_model.h"

using namespace pyscope;

TEST(GraphModel, AddNodeRejectsTakenIds) {
  graph::GraphModel g;
  EXPECT_TRUE(g.addNode(graph::GraphNode{"a", graph::NodeKind::Function, "A", std::nullopt}));
  EXPECT_FALSE(g.addNode(graph::GraphNode{"a", graph::NodeKind::Class, "A2", std::nullopt}));
  ASSERT_EQ(g.nodes().size(), 1u);
  EXPECT_EQ(g.findNode("a")->label, "A");
  EXPECT_EQ(g.findNode("missing"), nullptr);
}

TEST(GraphModel, AddEdgeRejectsSelfLoopsAndDuplicates) {
  graph::GraphModel g;
  EXPECT_FALSE(g.addEdge("a", "a", graph::EdgeKind::Calls));
  EXPECT_TRUE(g.addEdge("a", "b", graph::EdgeKind::Calls));
  EXPECT_FALSE(g.addEdge("a", "b", graph::EdgeKind::Calls));
  EXPECT_TRUE(g.addEdge("a", "b", graph::EdgeKind::Contains));
  EXPECT_EQ(g.edges().size(), 2u);
}

TEST(GraphModel, KindNames) {
  EXPECT_STREQ(graph::ToString(graph::NodeKind::MissingCaller), "missing-caller");
  EXPECT_STREQ(graph::EdgeLabel(graph::EdgeKind::ContainsMethod), "contains method");
  EXPECT_STREQ(graph::EdgeLabel(graph::EdgeKind::Inherits), "inherits");
}
