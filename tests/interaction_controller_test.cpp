#include "gtest/gtest.h"
#include <socialgraph/graph/interaction/interaction_controller.h>
#include <socialgraph/graph/render/camera_utils.h>
#include <socialgraph/graph/simulation_context.h>

#include <optional>
#include <string>

using namespace socialgraph::graph;

namespace {

GraphNode MakeNode(const std::string& id, ImVec2 position, bool fixed = false) {
    GraphNode node;
    node.id = id;
    node.label = id;
    node.type = fixed ? NodeType::Self : NodeType::Friend;
    node.fixed = fixed;
    node.position = position;
    node.influence = 0.5f;
    return node;
}

} // namespace

class InteractionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        m_context.view.canvas_size = ImVec2(800, 600);
        m_context.graph.AddNode(MakeNode("me", ImVec2(0, 0), true));
        m_context.graph.AddNode(MakeNode("pal", ImVec2(120, 40)));
        m_controller.SetSelectionCallback([this](const GraphNode* node) {
            ++m_callbacks;
            m_last = node ? std::optional<std::string>(node->id) : std::nullopt;
        });
    }

    ImVec2 ScreenOf(const std::string& id) const {
        return CameraUtils::WorldToScreen(m_context.graph.FindNode(id)->position, m_canvas_pos, m_context.view);
    }

    SimulationContext m_context;
    InteractionController m_controller;
    ImVec2 m_canvas_pos = ImVec2(20, 30);
    int m_callbacks = 0;
    std::optional<std::string> m_last;
};

TEST_F(InteractionControllerTest, ClickOnNodeSelectsIt) {
    const GraphNode* hit = m_controller.OnPointerDown(m_context, ScreenOf("pal"), m_canvas_pos);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->id, "pal");
    EXPECT_TRUE(m_context.interaction.selected_id == std::string("pal"));
    EXPECT_EQ(m_callbacks, 1);
    EXPECT_TRUE(m_last == std::string("pal"));
    EXPECT_EQ(m_context.SelectedNode()->id, "pal");
}

TEST_F(InteractionControllerTest, ClickWithinRadiusHits) {
    // Node radius is 8 + 12 * 0.5 = 14 world units at zoom 1.
    ImVec2 near = ScreenOf("pal");
    near.x += 10.0f;
    EXPECT_NE(m_controller.OnPointerDown(m_context, near, m_canvas_pos), nullptr);
}

TEST_F(InteractionControllerTest, ClickOnEmptySpaceClearsSelection) {
    m_controller.OnPointerDown(m_context, ScreenOf("me"), m_canvas_pos);
    ASSERT_TRUE(m_context.interaction.selected_id.has_value());

    const GraphNode* hit = m_controller.OnPointerDown(m_context, ImVec2(700, 550), m_canvas_pos);
    EXPECT_EQ(hit, nullptr);
    EXPECT_FALSE(m_context.interaction.selected_id.has_value());
    EXPECT_EQ(m_callbacks, 2);
    EXPECT_FALSE(m_last.has_value());
}

TEST_F(InteractionControllerTest, HoverFollowsPointer) {
    EXPECT_FALSE(InteractionController::WantsHandCursor(m_context));

    m_controller.OnPointerMove(m_context, ScreenOf("pal"), m_canvas_pos);
    EXPECT_TRUE(m_context.interaction.hovered_id == std::string("pal"));
    EXPECT_TRUE(InteractionController::WantsHandCursor(m_context));
    EXPECT_EQ(m_callbacks, 0);

    m_controller.OnPointerMove(m_context, ImVec2(700, 550), m_canvas_pos);
    EXPECT_FALSE(m_context.interaction.hovered_id.has_value());

    m_controller.OnPointerMove(m_context, ScreenOf("me"), m_canvas_pos);
    InteractionController::OnPointerLeave(m_context);
    EXPECT_FALSE(m_context.interaction.hovered_id.has_value());
    EXPECT_FALSE(InteractionController::WantsHandCursor(m_context));
}

TEST_F(InteractionControllerTest, HoverAndSelectionAreIndependent) {
    m_controller.OnPointerDown(m_context, ScreenOf("me"), m_canvas_pos);
    m_controller.OnPointerMove(m_context, ScreenOf("pal"), m_canvas_pos);
    EXPECT_TRUE(m_context.interaction.selected_id == std::string("me"));
    EXPECT_TRUE(m_context.interaction.hovered_id == std::string("pal"));
}

TEST_F(InteractionControllerTest, HitTestRespectsZoomAndPan) {
    m_context.view.zoom_scale = 2.5f;
    m_context.view.pan_offset = ImVec2(-60, 45);
    const GraphNode* hit = InteractionController::HitTest(m_context, ScreenOf("pal"), m_canvas_pos);
    ASSERT_NE(hit, nullptr);
    EXPECT_EQ(hit->id, "pal");
}

TEST_F(InteractionControllerTest, SelectByNodeIgnoresOverlap) {
    m_context.graph.AddNode(MakeNode("twin", ImVec2(120, 40)));

    // A click on the shared position resolves to the first node inserted.
    m_controller.OnPointerDown(m_context, ScreenOf("twin"), m_canvas_pos);
    EXPECT_TRUE(m_context.interaction.selected_id == std::string("pal"));

    m_controller.Select(m_context, m_context.graph.FindNode("twin"));
    EXPECT_TRUE(m_context.interaction.selected_id == std::string("twin"));
    EXPECT_TRUE(m_last == std::string("twin"));
    EXPECT_EQ(m_callbacks, 2);

    m_controller.Select(m_context, nullptr);
    EXPECT_FALSE(m_context.interaction.selected_id.has_value());
    EXPECT_FALSE(m_last.has_value());
}
