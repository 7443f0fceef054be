#ifndef SOCIALGRAPH_GRAPH_INTERACTION_INTERACTION_CONTROLLER_H
#define SOCIALGRAPH_GRAPH_INTERACTION_INTERACTION_CONTROLLER_H

#include <imgui.h>

#include <functional>
#include <utility>

namespace socialgraph {
namespace graph {

struct SimulationContext;
struct GraphNode;

/*
 * Maps pointer input to graph nodes and owns the hover/selection semantics.
 * Pointer positions are absolute screen coordinates; `canvas_pos` is the
 * absolute position of the canvas' top-left corner.
 */
class InteractionController {
public:
    // Receives the newly selected node, or nullptr when the selection is cleared.
    using SelectionCallback = std::function<void(const GraphNode*)>;

    void SetSelectionCallback(SelectionCallback callback) { selection_callback_ = std::move(callback); }

    // Nearest node whose rendered radius contains the pointer, or nullptr.
    static const GraphNode* HitTest(const SimulationContext& context,
                                    const ImVec2& pointer_screen,
                                    const ImVec2& canvas_pos);

    // Hit selects the node and notifies the callback; a miss clears the selection.
    const GraphNode* OnPointerDown(SimulationContext& context, const ImVec2& pointer_screen, const ImVec2& canvas_pos);

    // Selects `node` (nullptr clears) without hit-testing and notifies the callback.
    void Select(SimulationContext& context, const GraphNode* node);

    // Hit sets the hovered node; a miss clears hover. Returns the hovered node.
    const GraphNode* OnPointerMove(SimulationContext& context, const ImVec2& pointer_screen, const ImVec2& canvas_pos);

    // Pointer left the canvas.
    static void OnPointerLeave(SimulationContext& context);

    // True when the pointer is over a node (hand cursor affordance).
    static bool WantsHandCursor(const SimulationContext& context);

private:
    SelectionCallback selection_callback_;
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_INTERACTION_INTERACTION_CONTROLLER_H
