#include "gtest/gtest.h"
#include "test_doubles.h"

#include <socialgraph/cli/command_handler.h>
#include <socialgraph/graph/graph_manager.h>

#include <string>

using namespace socialgraph;
using socialgraph::test_support::RecordingSurface;
using socialgraph::test_support::RecordingUserInterface;
using socialgraph::test_support::ScriptedRelationshipSource;

class CommandHandlerTest : public ::testing::Test {
protected:
    CommandHandlerTest()
        : m_manager(m_source, m_frames, m_surface, m_ui),
          m_handler(m_manager, m_frames, m_ui) {}

    ScriptedRelationshipSource m_source;
    core::QueuedFrameScheduler m_frames;
    RecordingSurface m_surface;
    RecordingUserInterface m_ui;
    graph::GraphManager m_manager;
    cli::CommandHandler m_handler;
};

TEST_F(CommandHandlerTest, QuitAndExitStopTheLoop) {
    EXPECT_FALSE(m_handler.handleCommand("/quit"));
    EXPECT_FALSE(m_handler.handleCommand("/exit"));
    EXPECT_TRUE(m_handler.handleCommand(""));
    EXPECT_TRUE(m_handler.handleCommand("   "));
}

TEST_F(CommandHandlerTest, LoadThenStats) {
    EXPECT_TRUE(m_handler.handleCommand("/load alice"));
    EXPECT_EQ(m_manager.GetContext().graph.NodeCount(), 29u);

    m_handler.handleCommand("/stats");
    ASSERT_FALSE(m_ui.outputs.empty());
    EXPECT_EQ(m_ui.outputs.back(),
              "Total Connections: 150\n"
              "Mutual Connections: 25\n"
              "Clusters: 3\n"
              "Network Density: 15.0%");
}

TEST_F(CommandHandlerTest, NodesListsGraph) {
    m_handler.handleCommand("/nodes");
    EXPECT_EQ(m_ui.outputs.back(), "No graph loaded.");

    m_handler.handleCommand("/load alice");
    m_handler.handleCommand("/nodes");
    const std::string& listing = m_ui.outputs.back();
    EXPECT_NE(listing.find("alice"), std::string::npos);
    EXPECT_NE(listing.find("29 nodes, 61 edges"), std::string::npos);
}

TEST_F(CommandHandlerTest, StrengthCommand) {
    m_handler.handleCommand("/strength 0.7");
    EXPECT_FLOAT_EQ(m_manager.GetForceStrength(), 0.7f);
    EXPECT_EQ(m_ui.statuses.back(), "Force strength: 0.7");

    m_handler.handleCommand("/strength lots");
    EXPECT_EQ(m_ui.CountNotifications(Severity::Error), 1);
    EXPECT_FLOAT_EQ(m_manager.GetForceStrength(), 0.7f);
}

TEST_F(CommandHandlerTest, FilterAndModeCommands) {
    m_handler.handleCommand("/load alice");
    m_handler.handleCommand("/filter followers");
    EXPECT_EQ(m_manager.GetContext().settings.filter, graph::FilterType::Followers);
    EXPECT_EQ(m_manager.GetContext().graph.NodeCount(), 15u);

    m_handler.handleCommand("/mode circle");
    EXPECT_EQ(m_manager.GetContext().settings.view_mode, graph::ViewMode::Circle);

    m_handler.handleCommand("/mode spiral");
    m_handler.handleCommand("/filter enemies");
    EXPECT_EQ(m_ui.CountNotifications(Severity::Error), 2);
}

TEST_F(CommandHandlerTest, StepAdvancesRunningSimulation) {
    m_handler.handleCommand("/load alice");
    m_handler.handleCommand("/run");
    EXPECT_TRUE(m_manager.IsRunning());

    m_handler.handleCommand("/step 10");
    EXPECT_EQ(m_manager.GetScheduler().GetFrameCount(), 10u);
    EXPECT_GT(m_manager.GetLayout().GetIteration(), 0);

    m_handler.handleCommand("/pause");
    EXPECT_FALSE(m_manager.IsRunning());
    m_handler.handleCommand("/step 0");
    EXPECT_EQ(m_ui.CountNotifications(Severity::Error), 1);
}

TEST_F(CommandHandlerTest, ClickSelectsSubject) {
    m_handler.handleCommand("/load alice");
    // The subject sits at the center of the default 800x600 canvas.
    m_handler.handleCommand("/click 400 300");
    EXPECT_TRUE(m_ui.details_id == std::string("alice"));

    m_handler.handleCommand("/click 5 5");
    EXPECT_FALSE(m_ui.details_id.has_value());
}

TEST_F(CommandHandlerTest, LabelsToggle) {
    const bool before = m_manager.GetContext().settings.show_labels;
    m_handler.handleCommand("/labels");
    EXPECT_NE(m_manager.GetContext().settings.show_labels, before);
}

TEST_F(CommandHandlerTest, UnknownCommandShowsHelp) {
    EXPECT_TRUE(m_handler.handleCommand("/dance"));
    ASSERT_FALSE(m_ui.outputs.empty());
    EXPECT_EQ(m_ui.outputs.back().rfind("\nUnknown command. Available commands:", 0), 0u);

    m_handler.handleCommand("/help");
    EXPECT_EQ(m_ui.outputs.back().rfind("\nAvailable commands:", 0), 0u);
}

TEST(CommandHandlerStepTest, StatusReportsSettledLayout) {
    graph::RelationshipData data;
    data.stats.total_connections = 1;
    data.stats.followers = 1;
    ScriptedRelationshipSource source(data);
    core::QueuedFrameScheduler frames;
    RecordingSurface surface;
    RecordingUserInterface ui;
    graph::GraphManager manager(source, frames, surface, ui);
    cli::CommandHandler handler(manager, frames, ui);

    handler.handleCommand("/load solo");
    ASSERT_EQ(manager.GetContext().graph.NodeCount(), 2u);
    handler.handleCommand("/step");
    EXPECT_EQ(ui.statuses.back(), "Stepped 1 frame(s), state paused");

    handler.handleCommand("/run");
    handler.handleCommand("/step 2000");
    EXPECT_TRUE(manager.GetLayout().IsSettled());
    EXPECT_EQ(ui.statuses.back(), "Stepped 2000 frame(s), state running, settled");
}
