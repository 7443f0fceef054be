#include "gtest/gtest.h"
#include <socialgraph/graph/graph_types.h>

#include <stdexcept>

using namespace socialgraph::graph;

namespace {

GraphNode MakeNode(const std::string& id, NodeType type, bool fixed = false) {
    GraphNode node;
    node.id = id;
    node.label = id;
    node.type = type;
    node.fixed = fixed;
    node.position = ImVec2(15.0f, -7.0f);
    node.influence = 0.5f;
    return node;
}

GraphEdge MakeEdge(const std::string& a, const std::string& b, float strength = 0.5f) {
    GraphEdge edge;
    edge.source_id = a;
    edge.target_id = b;
    edge.type = EdgeType::Friend;
    edge.strength = strength;
    return edge;
}

} // namespace

TEST(SocialGraphTest, FixedSubjectIsPinnedAtOrigin) {
    SocialGraph graph;
    graph.AddNode(MakeNode("me", NodeType::Self, true));

    const GraphNode* subject = graph.GetSubject();
    ASSERT_NE(subject, nullptr);
    EXPECT_EQ(subject->position.x, 0.0f);
    EXPECT_EQ(subject->position.y, 0.0f);
}

TEST(SocialGraphTest, RejectsDuplicateAndEmptyIds) {
    SocialGraph graph;
    graph.AddNode(MakeNode("a", NodeType::Friend));
    EXPECT_THROW(graph.AddNode(MakeNode("a", NodeType::Follower)), std::invalid_argument);
    EXPECT_THROW(graph.AddNode(MakeNode("", NodeType::Follower)), std::invalid_argument);
    EXPECT_EQ(graph.NodeCount(), 1u);
}

TEST(SocialGraphTest, RejectsSecondFixedNode) {
    SocialGraph graph;
    graph.AddNode(MakeNode("me", NodeType::Self, true));
    EXPECT_THROW(graph.AddNode(MakeNode("other", NodeType::Self, true)), std::invalid_argument);
}

TEST(SocialGraphTest, EdgesMustReferenceKnownNodes) {
    SocialGraph graph;
    graph.AddNode(MakeNode("a", NodeType::Friend));
    graph.AddNode(MakeNode("b", NodeType::Friend));

    EXPECT_THROW(graph.AddEdge(MakeEdge("a", "ghost")), std::invalid_argument);
    EXPECT_THROW(graph.AddEdge(MakeEdge("a", "a")), std::invalid_argument);

    graph.AddEdge(MakeEdge("a", "b"));
    EXPECT_EQ(graph.EdgeCount(), 1u);
    EXPECT_TRUE(graph.HasEdge("a", "b"));
    EXPECT_TRUE(graph.HasEdge("b", "a"));
    EXPECT_EQ(graph.Degree("a"), 1);
}

TEST(SocialGraphTest, ClampsStrengthAndInfluence) {
    SocialGraph graph;
    GraphNode loud = MakeNode("a", NodeType::Friend);
    loud.influence = 3.0f;
    graph.AddNode(loud);
    graph.AddNode(MakeNode("b", NodeType::Friend));
    graph.AddEdge(MakeEdge("a", "b", -2.0f));

    EXPECT_FLOAT_EQ(graph.FindNode("a")->influence, 1.0f);
    EXPECT_FLOAT_EQ(graph.GetEdges().front().strength, 0.0f);
}

TEST(SocialGraphTest, KeepsInsertionOrder) {
    SocialGraph graph;
    graph.AddNode(MakeNode("c", NodeType::Friend));
    graph.AddNode(MakeNode("a", NodeType::Friend));
    graph.AddNode(MakeNode("b", NodeType::Friend));

    ASSERT_EQ(graph.NodeCount(), 3u);
    EXPECT_EQ(graph.GetNodes()[0].id, "c");
    EXPECT_EQ(graph.GetNodes()[2].id, "b");
    EXPECT_EQ(graph.IndexOf("a").value(), 1u);
    EXPECT_FALSE(graph.IndexOf("zzz").has_value());
}

TEST(GraphTypesTest, ParsesLowercaseNames) {
    EXPECT_TRUE(ParseViewMode("hierarchy") == ViewMode::Hierarchy);
    EXPECT_TRUE(ParseFilterType("followers") == FilterType::Followers);
    EXPECT_FALSE(ParseViewMode("spiral").has_value());
    EXPECT_FALSE(ParseFilterType("").has_value());
}

TEST(GraphTypesTest, FilterAndEdgeTypeMapping) {
    EXPECT_FALSE(NodeTypeFor(FilterType::All).has_value());
    EXPECT_TRUE(NodeTypeFor(FilterType::Friends) == NodeType::Friend);
    EXPECT_TRUE(NodeTypeFor(FilterType::Following) == NodeType::Following);
    EXPECT_TRUE(EdgeTypeFor(NodeType::Mutual) == EdgeType::Mutual);
    EXPECT_THROW(EdgeTypeFor(NodeType::Self), std::invalid_argument);
    EXPECT_STREQ(DisplayName(FilterType::All), "All Connections");
}
