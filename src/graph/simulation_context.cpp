#include <socialgraph/graph/simulation_context.h>

#include <algorithm>
#include <cmath>

namespace socialgraph {
namespace graph {

float SnapForceStrength(float value) {
    if (std::isnan(value)) return kDefaultForceStrength;
    const float clamped = std::clamp(value, kMinForceStrength, kMaxForceStrength);
    return std::round(clamped * 10.0f) / 10.0f;
}

const char* ToString(SimulationState state) {
    return state == SimulationState::Running ? "running" : "paused";
}

const GraphNode* SimulationContext::HoveredNode() const {
    return interaction.hovered_id ? graph.FindNode(*interaction.hovered_id) : nullptr;
}

const GraphNode* SimulationContext::SelectedNode() const {
    return interaction.selected_id ? graph.FindNode(*interaction.selected_id) : nullptr;
}

} // namespace graph
} // namespace socialgraph
