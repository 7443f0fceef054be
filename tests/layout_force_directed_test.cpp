#include "gtest/gtest.h"

#include <socialgraph/graph/layout/force_directed_layout.h>
#include <socialgraph/graph/simulation_context.h>

#include <cmath>

using namespace socialgraph::graph;

namespace {

GraphNode MakeNode(const std::string& id, const ImVec2& position, bool fixed = false) {
    GraphNode node;
    node.id = id;
    node.type = fixed ? NodeType::Self : NodeType::Friend;
    node.fixed = fixed;
    node.position = position;
    return node;
}

void Connect(SocialGraph& graph, const std::string& a, const std::string& b, float strength = 1.0f) {
    GraphEdge edge;
    edge.source_id = a;
    edge.target_id = b;
    edge.strength = strength;
    graph.AddEdge(edge);
}

} // namespace

// A stretched edge pulls the free endpoint toward the fixed subject.
TEST(ForceDirectedLayoutTest, SpringPullsStretchedEdgeTogether) {
    SocialGraph graph;
    graph.AddNode(MakeNode("me", ImVec2(0.0f, 0.0f), true));
    graph.AddNode(MakeNode("far", ImVec2(300.0f, 0.0f)));
    Connect(graph, "me", "far");

    ForceDirectedLayout layout;
    layout.UpdateLayout(graph, 0.3f);

    const GraphNode* far = graph.FindNode("far");
    EXPECT_LT(far->position.x, 300.0f);
    EXPECT_NEAR(far->position.y, 0.0f, 1e-4f);
}

// Nearby unconnected nodes push each other apart.
TEST(ForceDirectedLayoutTest, RepulsionSeparatesCloseNodes) {
    SocialGraph graph;
    graph.AddNode(MakeNode("a", ImVec2(-5.0f, 100.0f)));
    graph.AddNode(MakeNode("b", ImVec2(5.0f, 100.0f)));

    ForceDirectedLayout::LayoutParams params;
    params.center_strength = 0.0f;
    ForceDirectedLayout layout(params);
    layout.UpdateLayout(graph, 0.3f);

    EXPECT_LT(graph.FindNode("a")->position.x, -5.0f);
    EXPECT_GT(graph.FindNode("b")->position.x, 5.0f);
}

TEST(ForceDirectedLayoutTest, CoincidentNodesStillSeparate) {
    SocialGraph graph;
    graph.AddNode(MakeNode("a", ImVec2(50.0f, 50.0f)));
    graph.AddNode(MakeNode("b", ImVec2(50.0f, 50.0f)));

    ForceDirectedLayout layout;
    layout.UpdateLayout(graph, 0.3f);

    const GraphNode* a = graph.FindNode("a");
    const GraphNode* b = graph.FindNode("b");
    float dx = a->position.x - b->position.x;
    float dy = a->position.y - b->position.y;
    EXPECT_GT(std::sqrt(dx * dx + dy * dy), 0.0f);
    EXPECT_TRUE(std::isfinite(a->position.x));
    EXPECT_TRUE(std::isfinite(b->position.y));
}

TEST(ForceDirectedLayoutTest, FixedSubjectNeverMoves) {
    SocialGraph graph;
    graph.AddNode(MakeNode("me", ImVec2(0.0f, 0.0f), true));
    graph.AddNode(MakeNode("x", ImVec2(3.0f, 1.0f)));
    Connect(graph, "me", "x");

    ForceDirectedLayout layout;
    for (int i = 0; i < 50; ++i) {
        layout.UpdateLayout(graph, 1.0f);
        const GraphNode* subject = graph.GetSubject();
        ASSERT_EQ(subject->position.x, 0.0f);
        ASSERT_EQ(subject->position.y, 0.0f);
    }
}

TEST(ForceDirectedLayoutTest, PausedContextDoesNotAdvance) {
    SimulationContext context;
    context.graph.AddNode(MakeNode("me", ImVec2(0.0f, 0.0f), true));
    context.graph.AddNode(MakeNode("x", ImVec2(250.0f, 0.0f)));
    Connect(context.graph, "me", "x");

    ForceDirectedLayout layout;
    EXPECT_FALSE(layout.Update(context));
    EXPECT_EQ(context.graph.FindNode("x")->position.x, 250.0f);
    EXPECT_EQ(layout.GetIteration(), 0);

    context.state = SimulationState::Running;
    EXPECT_TRUE(layout.Update(context));
    EXPECT_LT(context.graph.FindNode("x")->position.x, 250.0f);
    EXPECT_EQ(layout.GetIteration(), 1);
}

TEST(ForceDirectedLayoutTest, StrongerCenterForcePullsHarder) {
    SocialGraph weak;
    weak.AddNode(MakeNode("x", ImVec2(200.0f, 0.0f)));
    SocialGraph strong = weak;

    ForceDirectedLayout layout;
    layout.UpdateLayout(weak, 0.1f);
    layout.UpdateLayout(strong, 1.0f);

    EXPECT_LT(strong.FindNode("x")->position.x, weak.FindNode("x")->position.x);
}

TEST(SnapForceStrengthTest, ClampsAndSnaps) {
    EXPECT_FLOAT_EQ(SnapForceStrength(0.7f), 0.7f);
    EXPECT_FLOAT_EQ(SnapForceStrength(0.0f), 0.1f);
    EXPECT_FLOAT_EQ(SnapForceStrength(5.0f), 1.0f);
    EXPECT_FLOAT_EQ(SnapForceStrength(0.34f), 0.3f);
    EXPECT_FLOAT_EQ(SnapForceStrength(std::nanf("")), kDefaultForceStrength);
}
