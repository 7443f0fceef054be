#include <socialgraph/graph/graph_manager.h>
#include <socialgraph/graph/render/camera_utils.h>

#include <iostream>

namespace socialgraph {
namespace graph {

GraphManager::GraphManager(RelationshipSource& source,
                           core::FrameScheduler& frames,
                           DrawSurface& surface,
                           UserInterface& ui)
    : ui_(ui),
      loader_(source, builder_),
      scheduler_(frames, context_, layout_, renderer_, surface) {
    interaction_.SetSelectionCallback([this](const GraphNode* node) {
        ui_.showNodeDetails(node);
        scheduler_.RequestRedraw();
    });
}

GraphManager::~GraphManager() {
    Teardown();
}

void GraphManager::LoadSubject(const std::string& subject_id) {
    context_.subject_id = subject_id.empty() ? std::string(kDefaultSubjectId) : subject_id;
    RequestLoad();
}

void GraphManager::SetFilter(FilterType filter) {
    if (context_.settings.filter == filter && !context_.graph.Empty()) return;
    context_.settings.filter = filter;
    RequestLoad();
}

void GraphManager::RequestLoad() {
    if (context_.subject_id.empty()) {
        context_.subject_id = kDefaultSubjectId;
    }
    loader_.Request(context_.subject_id, context_.settings.filter);
    ui_.displayStatus("Loading social graph for " + context_.subject_id + "...");
}

bool GraphManager::PollLoads() {
    std::optional<LoadResult> result = loader_.Poll();
    if (!result) return false;
    ApplyLoadResult(std::move(*result));
    return true;
}

void GraphManager::ApplyLoadResult(LoadResult&& result) {
    if (result.used_fallback) {
        std::cerr << "Error loading social graph for '" << result.subject_id << "': "
                  << result.error_detail << std::endl;
        ui_.notify(kLoadFailedMessage, Severity::Error);
    }

    // The graph is replaced wholesale; hover and selection refer to the old one.
    context_.graph = std::move(result.graph);
    context_.network_stats = result.network_stats;
    context_.stats = result.stats;
    context_.interaction = InteractionState{};
    ui_.showNodeDetails(nullptr);

    layout_engine_.Apply(context_.graph, context_.settings.view_mode);
    layout_.ResetPhysicsState();
    scheduler_.RequestRedraw();

    ui_.displayStatus("Loaded " + std::to_string(context_.graph.NodeCount()) + " nodes and " +
                      std::to_string(context_.graph.EdgeCount()) + " edges for " + result.subject_id);
}

void GraphManager::SetViewMode(ViewMode mode) {
    context_.settings.view_mode = mode;
    layout_engine_.Apply(context_.graph, mode);
    layout_.ResetPhysicsState();
    scheduler_.RequestRedraw();
}

void GraphManager::SetForceStrength(float value) {
    context_.settings.force_strength = SnapForceStrength(value);
}

void GraphManager::SetShowLabels(bool show) {
    context_.settings.show_labels = show;
    scheduler_.RequestRedraw();
}

void GraphManager::ApplySettings(const ViewSettings& settings) {
    const bool filter_changed = settings.filter != context_.settings.filter;
    const bool mode_changed = settings.view_mode != context_.settings.view_mode;

    context_.settings = settings;
    context_.settings.force_strength = SnapForceStrength(settings.force_strength);

    if (filter_changed && !context_.subject_id.empty()) {
        RequestLoad();
    } else if (mode_changed) {
        SetViewMode(settings.view_mode);
    }
}

SimulationState GraphManager::ToggleRunning() {
    return scheduler_.Toggle();
}

void GraphManager::Start() {
    scheduler_.Start();
}

void GraphManager::Pause() {
    scheduler_.Pause();
}

void GraphManager::SetCanvas(const ImVec2& canvas_size, float device_pixel_ratio) {
    context_.view.canvas_size = canvas_size;
    context_.view.device_pixel_ratio = device_pixel_ratio > 0.0f ? device_pixel_ratio : 1.0f;
}

void GraphManager::OnPointerMove(const ImVec2& pointer, const ImVec2& canvas_pos) {
    std::optional<NodeId> previous = context_.interaction.hovered_id;
    interaction_.OnPointerMove(context_, pointer, canvas_pos);
    if (previous != context_.interaction.hovered_id) {
        scheduler_.RequestRedraw();
    }
}

void GraphManager::OnPointerDown(const ImVec2& pointer, const ImVec2& canvas_pos) {
    interaction_.OnPointerDown(context_, pointer, canvas_pos);
}

void GraphManager::OnPointerLeave() {
    if (!context_.interaction.hovered_id) return;
    InteractionController::OnPointerLeave(context_);
    scheduler_.RequestRedraw();
}

void GraphManager::OnWheel(float wheel, const ImVec2& pointer, const ImVec2& canvas_pos) {
    CameraUtils::ZoomAt(context_.view, wheel, pointer, canvas_pos);
    scheduler_.RequestRedraw();
}

void GraphManager::OnPan(const ImVec2& delta) {
    CameraUtils::Pan(context_.view, delta);
    scheduler_.RequestRedraw();
}

void GraphManager::SelectNode(const NodeId& id) {
    const GraphNode* node = context_.graph.FindNode(id);
    if (!node) {
        ui_.notify("No node with id '" + id + "'", Severity::Warning);
        return;
    }
    interaction_.Select(context_, node);
}

std::optional<std::filesystem::path> GraphManager::ExportSnapshot(PixelSource& pixels,
                                                                  const std::filesystem::path& directory) {
    try {
        std::filesystem::path target_dir = directory.empty() ? ExportService::DefaultDownloadDirectory() : directory;
        std::filesystem::path written = exporter_.Export(pixels, target_dir);
        ui_.displayStatus("Graph exported to " + written.string());
        return written;
    } catch (const std::exception& e) {
        std::cerr << "Export failed: " << e.what() << std::endl;
        ui_.notify(std::string("Export failed: ") + e.what(), Severity::Error);
        return std::nullopt;
    }
}

void GraphManager::Teardown() {
    scheduler_.Teardown();
}

} // namespace graph
} // namespace socialgraph
