#include "gtest/gtest.h"
#include "test_doubles.h"

#include <socialgraph/graph/data/graph_data_builder.h>
#include <socialgraph/graph/layout/force_directed_layout.h>
#include <socialgraph/graph/layout/layout_engine.h>
#include <socialgraph/graph/simulation_context.h>

#include <cmath>
#include <iostream>

using namespace socialgraph::graph;
using socialgraph::test_support::SampleRelationshipData;

// Builds the sample graph, scatters it and relaxes it for 1000 frames at the
// default force strength. The motion must die down with the subject
// untouched at the origin.
class ForceConvergenceTest : public ::testing::TestWithParam<ViewMode> {
protected:
    void SetUp() override {
        GraphDataBuilder builder;
        m_context.graph = builder.Build(SampleRelationshipData(), "alice", FilterType::All);
        LayoutEngine().Apply(m_context.graph, GetParam());
        m_context.state = SimulationState::Running;
    }

    SimulationContext m_context;
    ForceDirectedLayout m_layout;
};

TEST_P(ForceConvergenceTest, KineticEnergySettles) {
    float early_energy = 0.0f;
    for (int frame = 1; frame <= 1000; ++frame) {
        ASSERT_TRUE(m_layout.Update(m_context));
        if (frame == 10) {
            early_energy = ForceDirectedLayout::TotalKineticEnergy(m_context.graph);
        }
        const GraphNode* subject = m_context.graph.GetSubject();
        ASSERT_EQ(subject->position.x, 0.0f) << "frame " << frame;
        ASSERT_EQ(subject->position.y, 0.0f) << "frame " << frame;
    }

    const float final_energy = ForceDirectedLayout::TotalKineticEnergy(m_context.graph);
    std::cout << "Kinetic energy after 10 frames: " << early_energy
              << ", after 1000 frames: " << final_energy << std::endl;
    EXPECT_GT(early_energy, 0.0f);
    EXPECT_LT(final_energy, 1e-2f);
    EXPECT_LT(final_energy, early_energy * 0.01f);

    for (const auto& node : m_context.graph.GetNodes()) {
        EXPECT_TRUE(std::isfinite(node.position.x) && std::isfinite(node.position.y)) << node.id;
    }
}

INSTANTIATE_TEST_SUITE_P(AllViewModes, ForceConvergenceTest,
                         ::testing::Values(ViewMode::Network, ViewMode::Circle, ViewMode::Hierarchy));
