#include <socialgraph/graph/render/camera_utils.h>
#include <socialgraph/graph/simulation_context.h> // full definition for GraphViewState

#include <algorithm>

namespace socialgraph {
namespace graph {

namespace {
constexpr float kMinZoom = 0.1f;
constexpr float kMaxZoom = 10.0f;
constexpr float kZoomSensitivity = 0.1f;
} // namespace

ImVec2 CameraUtils::WorldToCanvas(const ImVec2& world_pos, const GraphViewState& view_state) {
    float canvas_x = view_state.canvas_size.x * 0.5f + view_state.pan_offset.x + world_pos.x * view_state.zoom_scale;
    float canvas_y = view_state.canvas_size.y * 0.5f + view_state.pan_offset.y + world_pos.y * view_state.zoom_scale;
    return ImVec2(canvas_x, canvas_y);
}

ImVec2 CameraUtils::WorldToScreen(const ImVec2& world_pos, const ImVec2& canvas_pos, const GraphViewState& view_state) {
    ImVec2 local = WorldToCanvas(world_pos, view_state);
    return ImVec2(canvas_pos.x + local.x, canvas_pos.y + local.y);
}

ImVec2 CameraUtils::ScreenToWorld(const ImVec2& screen_pos, const ImVec2& canvas_pos, const GraphViewState& view_state) {
    if (view_state.zoom_scale == 0.0f) return ImVec2(0, 0);
    float local_x = screen_pos.x - canvas_pos.x - view_state.canvas_size.x * 0.5f - view_state.pan_offset.x;
    float local_y = screen_pos.y - canvas_pos.y - view_state.canvas_size.y * 0.5f - view_state.pan_offset.y;
    return ImVec2(local_x / view_state.zoom_scale, local_y / view_state.zoom_scale);
}

void CameraUtils::ZoomAt(GraphViewState& view_state, float wheel, const ImVec2& screen_pos, const ImVec2& canvas_pos) {
    if (wheel == 0.0f) return;

    float zoom_factor = 1.0f + wheel * kZoomSensitivity;
    float new_zoom = std::clamp(view_state.zoom_scale * zoom_factor, kMinZoom, kMaxZoom);
    if (view_state.zoom_scale <= 0.0f) {
        view_state.zoom_scale = new_zoom;
        return;
    }
    float applied = new_zoom / view_state.zoom_scale;

    // Pointer relative to the canvas center, the pivot of the view transform.
    ImVec2 pivot = ImVec2(screen_pos.x - canvas_pos.x - view_state.canvas_size.x * 0.5f,
                          screen_pos.y - canvas_pos.y - view_state.canvas_size.y * 0.5f);

    view_state.pan_offset.x = (view_state.pan_offset.x - pivot.x) * applied + pivot.x;
    view_state.pan_offset.y = (view_state.pan_offset.y - pivot.y) * applied + pivot.y;
    view_state.zoom_scale = new_zoom;
}

void CameraUtils::Pan(GraphViewState& view_state, const ImVec2& delta) {
    view_state.pan_offset.x += delta.x;
    view_state.pan_offset.y += delta.y;
}

} // namespace graph
} // namespace socialgraph
