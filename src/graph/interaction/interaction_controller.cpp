#include <socialgraph/graph/interaction/interaction_controller.h>
#include <socialgraph/graph/render/camera_utils.h>
#include <socialgraph/graph/render/graph_style.h>
#include <socialgraph/graph/simulation_context.h>

#include <limits>

namespace socialgraph {
namespace graph {

const GraphNode* InteractionController::HitTest(const SimulationContext& context,
                                                const ImVec2& pointer_screen,
                                                const ImVec2& canvas_pos) {
    const ImVec2 world = CameraUtils::ScreenToWorld(pointer_screen, canvas_pos, context.view);

    const GraphNode* best = nullptr;
    float best_distance_sq = std::numeric_limits<float>::max();
    for (const auto& node : context.graph.GetNodes()) {
        float dx = world.x - node.position.x;
        float dy = world.y - node.position.y;
        float distance_sq = dx * dx + dy * dy;
        float radius = GraphStyle::GetNodeRadius(node);
        if (distance_sq <= radius * radius && distance_sq < best_distance_sq) {
            best = &node;
            best_distance_sq = distance_sq;
        }
    }
    return best;
}

const GraphNode* InteractionController::OnPointerDown(SimulationContext& context,
                                                      const ImVec2& pointer_screen,
                                                      const ImVec2& canvas_pos) {
    const GraphNode* hit = HitTest(context, pointer_screen, canvas_pos);
    Select(context, hit);
    return hit;
}

void InteractionController::Select(SimulationContext& context, const GraphNode* node) {
    if (node) {
        context.interaction.selected_id = node->id;
    } else {
        context.interaction.selected_id.reset();
    }
    if (selection_callback_) {
        selection_callback_(node);
    }
}

const GraphNode* InteractionController::OnPointerMove(SimulationContext& context,
                                                      const ImVec2& pointer_screen,
                                                      const ImVec2& canvas_pos) {
    const GraphNode* hit = HitTest(context, pointer_screen, canvas_pos);
    if (hit) {
        context.interaction.hovered_id = hit->id;
    } else {
        context.interaction.hovered_id.reset();
    }
    return hit;
}

void InteractionController::OnPointerLeave(SimulationContext& context) {
    context.interaction.hovered_id.reset();
}

bool InteractionController::WantsHandCursor(const SimulationContext& context) {
    return context.HoveredNode() != nullptr;
}

} // namespace graph
} // namespace socialgraph
