#include "gtest/gtest.h"
#include "test_doubles.h"

#include <socialgraph/graph/data/graph_data_builder.h>
#include <socialgraph/graph/layout/layout_engine.h>

#include <cmath>

using namespace socialgraph::graph;
using socialgraph::test_support::SampleRelationshipData;

namespace {

float Radius(const GraphNode& node) {
    return std::sqrt(node.position.x * node.position.x + node.position.y * node.position.y);
}

} // namespace

class LayoutEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        GraphDataBuilder builder;
        m_graph = builder.Build(SampleRelationshipData(), "alice", FilterType::All);
        // Give everything a velocity so the reset is observable.
        for (auto& node : m_graph.GetNodes()) {
            node.velocity = ImVec2(3.0f, -2.0f);
        }
    }

    SocialGraph m_graph;
    LayoutEngine m_engine;
};

TEST_F(LayoutEngineTest, NetworkScatterIsSeededAndBounded) {
    m_engine.Apply(m_graph, ViewMode::Network);
    SocialGraph copy = m_graph;
    m_engine.Apply(copy, ViewMode::Network);

    for (size_t i = 0; i < m_graph.NodeCount(); ++i) {
        const GraphNode& node = m_graph.GetNodes()[i];
        EXPECT_EQ(node.velocity.x, 0.0f);
        EXPECT_EQ(node.velocity.y, 0.0f);
        EXPECT_FLOAT_EQ(node.position.x, copy.GetNodes()[i].position.x);
        EXPECT_FLOAT_EQ(node.position.y, copy.GetNodes()[i].position.y);
        if (node.fixed) continue;
        EXPECT_GE(Radius(node), 60.0f - 1e-3f);
        EXPECT_LE(Radius(node), 220.0f + 1e-3f);
    }
}

TEST_F(LayoutEngineTest, CirclePlacesAltersOnOneRadius) {
    m_engine.Apply(m_graph, ViewMode::Circle);
    for (const auto& node : m_graph.GetNodes()) {
        if (node.fixed) {
            EXPECT_EQ(node.position.x, 0.0f);
            EXPECT_EQ(node.position.y, 0.0f);
        } else {
            EXPECT_NEAR(Radius(node), 200.0f, 1e-3f);
        }
    }
}

TEST_F(LayoutEngineTest, HierarchyUsesOneRingPerType) {
    m_engine.Apply(m_graph, ViewMode::Hierarchy);
    for (const auto& node : m_graph.GetNodes()) {
        if (node.fixed) continue;
        EXPECT_NEAR(Radius(node), LayoutEngine::RingRadius(node.type), 1e-3f) << node.id;
    }
    EXPECT_LT(LayoutEngine::RingRadius(NodeType::Friend), LayoutEngine::RingRadius(NodeType::Mutual));
    EXPECT_LT(LayoutEngine::RingRadius(NodeType::Following), LayoutEngine::RingRadius(NodeType::Follower));
}

TEST_F(LayoutEngineTest, SubjectStaysAtOriginInEveryMode) {
    for (ViewMode mode : {ViewMode::Network, ViewMode::Circle, ViewMode::Hierarchy}) {
        m_engine.Apply(m_graph, mode);
        const GraphNode* subject = m_graph.GetSubject();
        ASSERT_NE(subject, nullptr);
        EXPECT_EQ(subject->position.x, 0.0f);
        EXPECT_EQ(subject->position.y, 0.0f);
    }
}

TEST_F(LayoutEngineTest, EmptyGraphIsANoOp) {
    SocialGraph empty;
    m_engine.Apply(empty, ViewMode::Circle);
    EXPECT_TRUE(empty.Empty());
}
