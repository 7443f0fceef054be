#include <socialgraph/gui/views/graph_view.h>
#include <socialgraph/gui/views/gui_interface.h>
#include <socialgraph/gui/render/imgui_draw_surface.h>
#include <socialgraph/gui/render/theme_utils.h>
#include <socialgraph/core/frame_scheduler.h>
#include <socialgraph/graph/graph_manager.h>
#include <socialgraph/graph/data/graph_stats.h>
#include <socialgraph/graph/interaction/interaction_controller.h>
#include <socialgraph/graph/render/graph_style.h>

#include <GLFW/glfw3.h>
#include <imgui.h>

#include <array>
#include <cmath>
#include <string>

namespace socialgraph {
namespace gui {

namespace {

constexpr float kSidePanelWidth = 260.0f;
constexpr std::array<graph::ViewMode, 3> kViewModes = {
    graph::ViewMode::Network, graph::ViewMode::Circle, graph::ViewMode::Hierarchy};
constexpr std::array<graph::FilterType, 4> kFilters = {
    graph::FilterType::All, graph::FilterType::Friends, graph::FilterType::Followers, graph::FilterType::Following};

bool IconButton(const char* label, const char* tooltip) {
    bool pressed = ImGui::Button(label);
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("%s", tooltip);
    }
    return pressed;
}

void drawHeader(GuiInterface& gui) {
    ImGui::TextUnformatted("Social Network Graph");
    const float close_width = ImGui::GetFrameHeight();
    ImGui::SameLine(ImGui::GetWindowContentRegionMax().x - close_width);
    if (ImGui::Button("\xC3\x97", ImVec2(close_width, close_width))) {
        gui.requestClose();
    }
    if (ImGui::IsItemHovered()) {
        ImGui::SetTooltip("Close");
    }
    ImGui::Separator();
}

void drawControls(graph::GraphManager& gm, GraphWindowState& state) {
    const graph::SimulationContext& ctx = gm.GetContext();

    if (IconButton(ctx.IsRunning() ? "Pause" : "Start",
                   ctx.IsRunning() ? "Pause animation" : "Start animation")) {
        gm.ToggleRunning();
    }
    ImGui::SameLine();
    if (IconButton(ctx.settings.show_labels ? "Labels: On" : "Labels: Off", "Toggle labels")) {
        gm.ToggleLabels();
    }
    ImGui::SameLine();
    if (IconButton(ctx.settings.fullscreen ? "Exit Fullscreen" : "Fullscreen", "Toggle fullscreen")) {
        gm.ToggleFullscreen();
    }
    ImGui::SameLine();
    if (IconButton("Export", "Export graph")) {
        state.export_requested = true;
    }

    ImGui::SameLine();
    ImGui::SetNextItemWidth(130.0f);
    if (ImGui::BeginCombo("View", graph::DisplayName(ctx.settings.view_mode))) {
        for (graph::ViewMode mode : kViewModes) {
            bool is_selected = mode == ctx.settings.view_mode;
            if (ImGui::Selectable(graph::DisplayName(mode), is_selected) && !is_selected) {
                gm.SetViewMode(mode);
            }
            if (is_selected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }

    ImGui::SameLine();
    ImGui::SetNextItemWidth(160.0f);
    ImGui::BeginDisabled(gm.IsLoading());
    if (ImGui::BeginCombo("Filter", graph::DisplayName(ctx.settings.filter))) {
        for (graph::FilterType filter : kFilters) {
            bool is_selected = filter == ctx.settings.filter;
            if (ImGui::Selectable(graph::DisplayName(filter), is_selected) && !is_selected) {
                gm.SetFilter(filter);
            }
            if (is_selected) ImGui::SetItemDefaultFocus();
        }
        ImGui::EndCombo();
    }
    ImGui::EndDisabled();

    ImGui::SameLine();
    ImGui::SetNextItemWidth(150.0f);
    float strength = gm.GetForceStrength();
    if (ImGui::SliderFloat("Force", &strength, graph::kMinForceStrength, graph::kMaxForceStrength, "%.1f")) {
        gm.SetForceStrength(strength);
    }

    ImGui::SameLine();
    if (gm.IsLoading()) {
        ImGui::TextColored(ImVec4(1.0f, 0.85f, 0.2f, 1.0f), "Loading...");
    } else if (ctx.IsRunning()) {
        ImGui::TextColored(ImVec4(0.0f, 1.0f, 0.53f, 1.0f), "RUNNING");
    } else {
        ImGui::TextColored(ImVec4(0.6f, 0.6f, 0.6f, 1.0f), "PAUSED");
    }
}

void drawCanvas(graph::GraphManager& gm,
                GuiInterface& gui,
                core::QueuedFrameScheduler& frames,
                ImGuiDrawSurface& surface,
                GraphWindowState& state,
                const ImVec2& size) {
    ImGui::BeginChild("GraphCanvas", size, true, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);

    const ImVec2 canvas_pos = ImGui::GetCursorScreenPos();
    ImVec2 canvas_size = ImGui::GetContentRegionAvail();
    if (canvas_size.x < 50.0f) canvas_size.x = 50.0f;
    if (canvas_size.y < 50.0f) canvas_size.y = 50.0f;

    ImGui::InvisibleButton("canvas", canvas_size,
                           ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonMiddle);
    const bool is_hovered = ImGui::IsItemHovered();
    const ImGuiIO& io = ImGui::GetIO();

    gm.SetCanvas(canvas_size, gui.getDevicePixelRatio());

    if (is_hovered) {
        gm.OnPointerMove(io.MousePos, canvas_pos);
        if (ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
            gm.OnPointerDown(io.MousePos, canvas_pos);
        }
        if (io.MouseWheel != 0.0f) {
            gm.OnWheel(io.MouseWheel, io.MousePos, canvas_pos);
        }
        if (graph::InteractionController::WantsHandCursor(gm.GetContext())) {
            ImGui::SetMouseCursor(ImGuiMouseCursor_Hand);
        }
    } else if (state.pointer_was_inside) {
        gm.OnPointerLeave();
    }
    state.pointer_was_inside = is_hovered;

    if (ImGui::IsItemActive() && ImGui::IsMouseDragging(ImGuiMouseButton_Middle, 0.0f)) {
        gm.OnPan(io.MouseDelta);
    }

    // The renderer only draws from frame callbacks. A paused simulation
    // still needs one per ImGui frame because the draw list is rebuilt.
    surface.Begin(ImGui::GetWindowDrawList(), canvas_pos, canvas_size);
    if (!gm.IsRunning()) {
        gm.RequestRedraw();
    }
    frames.RunPendingFrames(ImGui::GetTime());
    surface.End();

    ImGui::EndChild();
}

void drawLegendEntry(graph::NodeType type) {
    const ImVec2 pos = ImGui::GetCursorScreenPos();
    const float h = ImGui::GetTextLineHeight();
    ImGui::GetWindowDrawList()->AddCircleFilled(ImVec2(pos.x + h * 0.5f, pos.y + h * 0.5f), h * 0.35f,
                                                graph::GraphStyle::GetNodeColor(type));
    ImGui::Dummy(ImVec2(h, h));
    ImGui::SameLine();
    ImGui::TextUnformatted(graph::DisplayName(type));
}

void drawSidePanel(graph::GraphManager& gm, GuiInterface& gui) {
    const graph::SimulationContext& ctx = gm.GetContext();

    ImGui::BeginChild("SidePanel", ImVec2(0.0f, 0.0f), true);

    ImGui::TextUnformatted("Network Stats");
    ImGui::Separator();
    if (gm.IsLoading() && ctx.graph.Empty()) {
        ImGui::TextDisabled("Loading...");
    } else {
        ImGui::Text("Total Connections: %d", ctx.stats.total_connections);
        ImGui::Text("Mutual Connections: %d", ctx.stats.mutual_connections);
        ImGui::Text("Clusters: %d", ctx.stats.clusters);
        ImGui::Text("Network Density: %s", graph::FormatDensity(ctx.stats.density).c_str());
    }

    ImGui::Spacing();
    ImGui::TextUnformatted("Legend");
    ImGui::Separator();
    drawLegendEntry(graph::NodeType::Friend);
    drawLegendEntry(graph::NodeType::Follower);
    drawLegendEntry(graph::NodeType::Following);
    drawLegendEntry(graph::NodeType::Mutual);

    const std::optional<graph::GraphNode>& selected = gui.getSelectedNode();
    if (selected) {
        ImGui::Spacing();
        ImGui::TextUnformatted("Node Info");
        ImGui::Separator();
        ImGui::TextWrapped("%s", selected->label.c_str());
        ImGui::Text("Type: %s", graph::DisplayName(selected->type));
        ImGui::Text("Connections: %d", selected->connection_count);
        ImGui::Text("Influence: %d%%", static_cast<int>(std::lround(selected->influence * 100.0f)));
    }

    if (!gui.getStatus().empty()) {
        ImGui::Spacing();
        ImGui::Separator();
        ImGui::TextDisabled("%s", gui.getStatus().c_str());
    }

    ImGui::EndChild();
}

} // anonymous namespace

void drawGraphWindow(graph::GraphManager& gm,
                     GuiInterface& gui,
                     core::QueuedFrameScheduler& frames,
                     ImGuiDrawSurface& surface,
                     GraphWindowState& state) {
    const ImVec2 display_size = ImGui::GetIO().DisplaySize;
    ImGui::SetNextWindowPos(ImVec2(0.0f, 0.0f));
    ImGui::SetNextWindowSize(display_size);
    ImGui::Begin("Graph", nullptr,
                 ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoMove |
                 ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoBringToFrontOnFocus);

    const bool fullscreen = gm.GetContext().settings.fullscreen;
    if (!fullscreen) {
        drawHeader(gui);
    }
    drawControls(gm, state);
    ImGui::Separator();

    if (fullscreen) {
        drawCanvas(gm, gui, frames, surface, state, ImVec2(0.0f, 0.0f));
    } else {
        const float canvas_width = ImGui::GetContentRegionAvail().x - kSidePanelWidth - ImGui::GetStyle().ItemSpacing.x;
        drawCanvas(gm, gui, frames, surface, state, ImVec2(canvas_width, 0.0f));
        ImGui::SameLine();
        drawSidePanel(gm, gui);
    }

    ImGui::End();
}

void drawToasts(GuiInterface& gui) {
    gui.dropExpiredToasts();
    const auto& toasts = gui.getToasts();
    if (toasts.empty()) return;

    const ImVec2 display_size = ImGui::GetIO().DisplaySize;
    const float padding = 12.0f;
    ImDrawList* draw_list = ImGui::GetForegroundDrawList();

    float y = display_size.y - padding;
    for (auto it = toasts.rbegin(); it != toasts.rend(); ++it) {
        const ImVec2 text_size = ImGui::CalcTextSize(it->message.c_str());
        const ImVec2 box_max(display_size.x - padding, y);
        const ImVec2 box_min(box_max.x - text_size.x - 2.0f * padding, y - text_size.y - padding);
        draw_list->AddRectFilled(box_min, box_max, ThemeUtils::GetToastColor(it->severity == Severity::Error), 6.0f);
        draw_list->AddText(ImVec2(box_min.x + padding, box_min.y + padding * 0.5f), IM_COL32_WHITE, it->message.c_str());
        y = box_min.y - padding * 0.5f;
    }
}

} // namespace gui
} // namespace socialgraph
