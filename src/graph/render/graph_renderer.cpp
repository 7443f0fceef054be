#include <socialgraph/graph/render/graph_renderer.h>
#include <socialgraph/graph/render/camera_utils.h>
#include <socialgraph/graph/render/graph_style.h>
#include <socialgraph/graph/simulation_context.h>

#include <iostream>

namespace socialgraph {
namespace graph {

bool GraphRenderer::Draw(const SimulationContext& context, DrawSurface& surface) {
    if (!surface.IsAvailable()) {
        if (!unavailable_reported_) {
            std::cerr << "Warning: drawing surface unavailable, graph rendering disabled" << std::endl;
            unavailable_reported_ = true;
        }
        return false;
    }
    unavailable_reported_ = false;

    surface.SetScale(context.view.device_pixel_ratio);
    surface.Clear(GraphStyle::GetBackgroundColor());

    DrawEdges(context, surface);
    DrawNodes(context, surface);
    if (context.settings.show_labels) {
        DrawLabels(context, surface);
    }
    ++frames_drawn_;
    return true;
}

void GraphRenderer::DrawEdges(const SimulationContext& context, DrawSurface& surface) const {
    const SocialGraph& graph = context.graph;
    std::vector<ImVec2> segment(2);
    for (const auto& edge : graph.GetEdges()) {
        const GraphNode* source = graph.FindNode(edge.source_id);
        const GraphNode* target = graph.FindNode(edge.target_id);
        if (!source || !target) continue;

        segment[0] = CameraUtils::WorldToCanvas(source->position, context.view);
        segment[1] = CameraUtils::WorldToCanvas(target->position, context.view);
        surface.StrokePath(segment,
                           GraphStyle::GetEdgeColor(edge.type, edge.strength),
                           GraphStyle::GetEdgeThickness(edge.strength));
    }
}

void GraphRenderer::DrawNodes(const SimulationContext& context, DrawSurface& surface) const {
    const auto& interaction = context.interaction;
    for (const auto& node : context.graph.GetNodes()) {
        ImVec2 center = CameraUtils::WorldToCanvas(node.position, context.view);
        float radius = GraphStyle::GetNodeRadius(node) * context.view.zoom_scale;

        surface.FillCircle(center, radius, GraphStyle::GetNodeColor(node.type));

        if (interaction.hovered_id && *interaction.hovered_id == node.id) {
            surface.StrokeCircle(center, radius + 4.0f, GraphStyle::GetHoverRingColor(), 2.0f);
        }
        if (interaction.selected_id && *interaction.selected_id == node.id) {
            surface.StrokeCircle(center, radius + 7.0f, GraphStyle::GetSelectionRingColor(), 3.0f);
        }
    }
}

void GraphRenderer::DrawLabels(const SimulationContext& context, DrawSurface& surface) const {
    for (const auto& node : context.graph.GetNodes()) {
        ImVec2 center = CameraUtils::WorldToCanvas(node.position, context.view);
        float radius = GraphStyle::GetNodeRadius(node) * context.view.zoom_scale;

        if (!node.avatar.empty()) {
            surface.DrawText(center, GraphStyle::GetAvatarTextColor(), node.avatar);
        }
        if (!node.label.empty()) {
            surface.DrawText(ImVec2(center.x, center.y + radius + 10.0f), GraphStyle::GetLabelColor(), node.label);
        }
    }
}

} // namespace graph
} // namespace socialgraph
