#ifndef SOCIALGRAPH_GRAPH_RENDER_GRAPH_RENDERER_H
#define SOCIALGRAPH_GRAPH_RENDER_GRAPH_RENDERER_H

#include <socialgraph/graph/render/draw_surface.h>

namespace socialgraph {
namespace graph {

struct SimulationContext;
struct GraphNode;

/*
 * Draws one frame of the graph: clear, edges, nodes (with hover and
 * selection rings), then labels and avatars when the label toggle is on.
 * With labels off no text call is issued for the frame.
 */
class GraphRenderer {
public:
    GraphRenderer() = default;

    // Returns false when the surface is unavailable and nothing was drawn.
    bool Draw(const SimulationContext& context, DrawSurface& surface);

    int GetFramesDrawn() const { return frames_drawn_; }

private:
    void DrawEdges(const SimulationContext& context, DrawSurface& surface) const;
    void DrawNodes(const SimulationContext& context, DrawSurface& surface) const;
    void DrawLabels(const SimulationContext& context, DrawSurface& surface) const;

    bool unavailable_reported_ = false;
    int frames_drawn_ = 0;
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_RENDER_GRAPH_RENDERER_H
