#include "gtest/gtest.h"
#include "test_doubles.h"

#include <socialgraph/graph/render/graph_renderer.h>
#include <socialgraph/graph/render/graph_style.h>
#include <socialgraph/graph/simulation_context.h>

using namespace socialgraph::graph;
using socialgraph::test_support::RecordingSurface;

namespace {

GraphNode MakeNode(const std::string& id, const std::string& avatar, ImVec2 position, bool fixed = false) {
    GraphNode node;
    node.id = id;
    node.label = id == "me" ? "You" : id;
    node.avatar = avatar;
    node.type = fixed ? NodeType::Self : NodeType::Follower;
    node.fixed = fixed;
    node.position = position;
    node.influence = 0.25f;
    return node;
}

} // namespace

class GraphRendererTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_context.graph.AddNode(MakeNode("me", "Y", ImVec2(0, 0), true));
        m_context.graph.AddNode(MakeNode("fan", "F", ImVec2(90, 0)));
        GraphEdge edge;
        edge.source_id = "me";
        edge.target_id = "fan";
        edge.type = EdgeType::Follower;
        edge.strength = 0.5f;
        m_context.graph.AddEdge(edge);
    }

    SimulationContext m_context;
    GraphRenderer m_renderer;
    RecordingSurface m_surface;
};

TEST_F(GraphRendererTest, DrawsClearEdgesThenNodes) {
    ASSERT_TRUE(m_renderer.Draw(m_context, m_surface));

    ASSERT_GE(m_surface.calls.size(), 5u);
    EXPECT_EQ(m_surface.calls[0], "scale");
    EXPECT_EQ(m_surface.calls[1], "clear");
    EXPECT_EQ(m_surface.calls[2], "path");
    EXPECT_EQ(m_surface.calls[3], "circle");
    EXPECT_EQ(m_surface.calls[4], "circle");
    EXPECT_EQ(m_surface.CountCalls("path"), 1);
    EXPECT_EQ(m_surface.paths.front().size(), 2u);
    EXPECT_EQ(m_renderer.GetFramesDrawn(), 1);
}

TEST_F(GraphRendererTest, LabelsToggleControlsText) {
    m_context.settings.show_labels = true;
    m_renderer.Draw(m_context, m_surface);
    EXPECT_EQ(m_surface.text_calls, 4);
    EXPECT_EQ(m_surface.CountCalls("text:You"), 1);
    EXPECT_EQ(m_surface.CountCalls("text:F"), 1);

    m_surface.Reset();
    m_context.settings.show_labels = false;
    m_renderer.Draw(m_context, m_surface);
    EXPECT_EQ(m_surface.text_calls, 0);
    EXPECT_EQ(m_surface.CountCalls("circle"), 2);
}

TEST_F(GraphRendererTest, ForwardsDevicePixelRatio) {
    m_context.view.device_pixel_ratio = 2.0f;
    m_renderer.Draw(m_context, m_surface);
    ASSERT_EQ(m_surface.scales.size(), 1u);
    EXPECT_FLOAT_EQ(m_surface.scales.front(), 2.0f);
}

TEST_F(GraphRendererTest, SubjectSitsAtCanvasCenter) {
    m_context.view.canvas_size = ImVec2(640, 480);
    m_renderer.Draw(m_context, m_surface);
    ASSERT_EQ(m_surface.circles.size(), 2u);
    EXPECT_FLOAT_EQ(m_surface.circles[0].first.x, 320.0f);
    EXPECT_FLOAT_EQ(m_surface.circles[0].first.y, 240.0f);
    EXPECT_FLOAT_EQ(m_surface.circles[0].second, 24.0f);
}

TEST_F(GraphRendererTest, HoverAndSelectionRings) {
    m_context.interaction.hovered_id = "fan";
    m_context.interaction.selected_id = "fan";
    m_renderer.Draw(m_context, m_surface);

    const float radius = GraphStyle::GetNodeRadius(*m_context.graph.FindNode("fan"));
    ASSERT_EQ(m_surface.ring_radii.size(), 2u);
    EXPECT_FLOAT_EQ(m_surface.ring_radii[0], radius + 4.0f);
    EXPECT_FLOAT_EQ(m_surface.ring_radii[1], radius + 7.0f);
}

TEST_F(GraphRendererTest, UnavailableSurfaceSkipsFrame) {
    m_surface.available = false;
    EXPECT_FALSE(m_renderer.Draw(m_context, m_surface));
    EXPECT_FALSE(m_renderer.Draw(m_context, m_surface));
    EXPECT_TRUE(m_surface.calls.empty());
    EXPECT_EQ(m_renderer.GetFramesDrawn(), 0);
}

TEST_F(GraphRendererTest, EmptyGraphOnlyClears) {
    SimulationContext empty;
    EXPECT_TRUE(m_renderer.Draw(empty, m_surface));
    EXPECT_EQ(m_surface.calls.size(), 2u);
}
