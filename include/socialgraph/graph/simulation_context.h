#ifndef SOCIALGRAPH_GRAPH_SIMULATION_CONTEXT_H
#define SOCIALGRAPH_GRAPH_SIMULATION_CONTEXT_H

#include <imgui.h>
#include <socialgraph/core/id_types.h>
#include <socialgraph/graph/data/graph_stats.h>
#include <socialgraph/graph/graph_types.h>

#include <optional>
#include <string>

namespace socialgraph {
namespace graph {

inline constexpr float kMinForceStrength = 0.1f;
inline constexpr float kMaxForceStrength = 1.0f;
inline constexpr float kDefaultForceStrength = 0.3f;

// Clamps to [0.1, 1.0] and snaps to the nearest 0.1 step.
float SnapForceStrength(float value);

enum class SimulationState {
    Paused,
    Running
};

const char* ToString(SimulationState state);

// User-controlled options. Persisted between sessions (see db::ViewSettingsStore).
struct ViewSettings {
    ViewMode view_mode = ViewMode::Network;
    FilterType filter = FilterType::All;
    float force_strength = kDefaultForceStrength;
    bool show_labels = true;
    bool fullscreen = false;  // display only
};

// Camera over simulation space. The origin maps to the canvas center, then
// pan and zoom apply; canvas coordinates are logical (pre device-pixel-ratio).
struct GraphViewState {
    ImVec2 pan_offset = ImVec2(0.0f, 0.0f);
    float zoom_scale = 1.0f;
    ImVec2 canvas_size = ImVec2(800.0f, 600.0f);
    float device_pixel_ratio = 1.0f;
};

// Independent hover and selection slots.
struct InteractionState {
    std::optional<NodeId> hovered_id;
    std::optional<NodeId> selected_id;
};

/*
 * Everything one visualization instance mutates, threaded explicitly through
 * every stage: the loader writes graph/stats, the layout and simulator move
 * nodes, the renderer and interaction controller read it each frame.
 */
struct SimulationContext {
    std::string subject_id;
    SocialGraph graph;
    NetworkStats network_stats;
    GraphStats stats;
    ViewSettings settings;
    GraphViewState view;
    InteractionState interaction;
    SimulationState state = SimulationState::Paused;

    bool IsRunning() const { return state == SimulationState::Running; }
    const GraphNode* HoveredNode() const;
    const GraphNode* SelectedNode() const;
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_SIMULATION_CONTEXT_H
