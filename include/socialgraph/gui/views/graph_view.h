#pragma once

// Forward declarations to avoid including heavy headers
namespace socialgraph {
namespace core { class QueuedFrameScheduler; }
namespace graph { class GraphManager; }
namespace gui {

class GuiInterface;
class ImGuiDrawSurface;

// Per-window state the views keep between frames.
struct GraphWindowState {
    bool export_requested = false;
    bool pointer_was_inside = false;
};

/*
 * @brief Renders the graph window for one frame.
 *
 * Draws the header, the control bar, the canvas (pumping the frame scheduler
 * inside it so the renderer draws into this frame's draw list) and the side
 * panel with statistics, legend and node details.
 */
void drawGraphWindow(graph::GraphManager& gm,
                     GuiInterface& gui,
                     core::QueuedFrameScheduler& frames,
                     ImGuiDrawSurface& surface,
                     GraphWindowState& state);

// Stacked notifications in the bottom-right corner.
void drawToasts(GuiInterface& gui);

} // namespace gui
} // namespace socialgraph
