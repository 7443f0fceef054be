#ifndef SOCIALGRAPH_GRAPH_RENDER_CAMERA_UTILS_H
#define SOCIALGRAPH_GRAPH_RENDER_CAMERA_UTILS_H

#include <imgui.h>

namespace socialgraph {
namespace graph {

// Forward declarations
struct GraphViewState;

/*
 * Utility helpers for camera transformations in the graph view.
 * All methods are static; an instance of CameraUtils is never created.
 *
 * "Canvas" coordinates are relative to the canvas' top-left corner, "screen"
 * coordinates are absolute display coordinates.
 */
class CameraUtils {
public:
    // Simulation space -> canvas coordinates (origin at canvas center, then pan and zoom).
    static ImVec2 WorldToCanvas(const ImVec2& world_pos, const GraphViewState& view_state);

    // Simulation space -> absolute screen coordinates.
    static ImVec2 WorldToScreen(const ImVec2& world_pos,
                                const ImVec2& canvas_screen_pos_absolute,
                                const GraphViewState& view_state);

    // Absolute screen coordinates -> simulation space (inverse of WorldToScreen).
    static ImVec2 ScreenToWorld(const ImVec2& screen_pos_absolute,
                                const ImVec2& canvas_screen_pos_absolute,
                                const GraphViewState& view_state);

    // Applies a wheel step, keeping the world point under the pointer fixed.
    // The zoom is clamped to [0.1, 10].
    static void ZoomAt(GraphViewState& view_state, float wheel,
                       const ImVec2& screen_pos_absolute,
                       const ImVec2& canvas_screen_pos_absolute);

    static void Pan(GraphViewState& view_state, const ImVec2& delta);
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_RENDER_CAMERA_UTILS_H
