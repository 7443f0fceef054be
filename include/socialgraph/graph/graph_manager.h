#ifndef SOCIALGRAPH_GRAPH_GRAPH_MANAGER_H
#define SOCIALGRAPH_GRAPH_GRAPH_MANAGER_H

#include <socialgraph/core/animation_scheduler.h>
#include <socialgraph/core/frame_scheduler.h>
#include <socialgraph/core/ui_interface.h>
#include <socialgraph/graph/data/graph_data_builder.h>
#include <socialgraph/graph/data/graph_loader.h>
#include <socialgraph/graph/data/relationship_source.h>
#include <socialgraph/graph/export/export_service.h>
#include <socialgraph/graph/interaction/interaction_controller.h>
#include <socialgraph/graph/layout/force_directed_layout.h>
#include <socialgraph/graph/layout/layout_engine.h>
#include <socialgraph/graph/render/draw_surface.h>
#include <socialgraph/graph/render/graph_renderer.h>
#include <socialgraph/graph/simulation_context.h>

#include <filesystem>
#include <optional>
#include <string>

namespace socialgraph {
namespace graph {

inline constexpr const char* kLoadFailedMessage = "Failed to load social graph";

/*
 * Owns one visualization instance: the simulation context and every stage
 * operating on it (loader, layout, physics, renderer, interaction, frame
 * loop, export). Front ends drive it through the control operations below
 * and pump PollLoads() once per host frame.
 */
class GraphManager {
public:
    GraphManager(RelationshipSource& source,
                 core::FrameScheduler& frames,
                 DrawSurface& surface,
                 UserInterface& ui);
    ~GraphManager();

    GraphManager(const GraphManager&) = delete;
    GraphManager& operator=(const GraphManager&) = delete;

    // --- Data ---
    void LoadSubject(const std::string& subject_id);
    void SetFilter(FilterType filter);
    // Applies finished loads. Returns true when a new graph was installed.
    bool PollLoads();
    bool IsLoading() const { return loader_.IsLoading(); }
    void WaitForLoads() { loader_.WaitForIdle(); }

    // --- Controls ---
    void SetViewMode(ViewMode mode);
    void SetForceStrength(float value);
    float GetForceStrength() const { return context_.settings.force_strength; }
    void SetShowLabels(bool show);
    void ToggleLabels() { SetShowLabels(!context_.settings.show_labels); }
    void ToggleFullscreen() { context_.settings.fullscreen = !context_.settings.fullscreen; }
    void ApplySettings(const ViewSettings& settings);

    SimulationState ToggleRunning();
    void Start();
    void Pause();
    bool IsRunning() const { return context_.IsRunning(); }
    void RequestRedraw() { scheduler_.RequestRedraw(); }

    // --- Pointer input (absolute screen coordinates) ---
    void SetCanvas(const ImVec2& canvas_size, float device_pixel_ratio);
    void OnPointerMove(const ImVec2& pointer, const ImVec2& canvas_pos);
    void OnPointerDown(const ImVec2& pointer, const ImVec2& canvas_pos);
    void OnPointerLeave();
    void OnWheel(float wheel, const ImVec2& pointer, const ImVec2& canvas_pos);
    void OnPan(const ImVec2& delta);
    void SelectNode(const NodeId& id);

    // --- Export ---
    // Writes social-graph.png into `directory` (default download directory when
    // empty). Failures are reported through the UI; returns the path on success.
    std::optional<std::filesystem::path> ExportSnapshot(PixelSource& pixels,
                                                        const std::filesystem::path& directory = {});

    // Cancels the frame loop; no further frame callbacks run afterwards.
    void Teardown();

    const SimulationContext& GetContext() const { return context_; }
    const core::AnimationScheduler& GetScheduler() const { return scheduler_; }
    const ForceDirectedLayout& GetLayout() const { return layout_; }

private:
    void RequestLoad();
    void ApplyLoadResult(LoadResult&& result);

    UserInterface& ui_;
    SimulationContext context_;
    GraphDataBuilder builder_;
    GraphLoader loader_;
    LayoutEngine layout_engine_;
    ForceDirectedLayout layout_;
    GraphRenderer renderer_;
    InteractionController interaction_;
    ExportService exporter_;
    core::AnimationScheduler scheduler_;
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_GRAPH_MANAGER_H
