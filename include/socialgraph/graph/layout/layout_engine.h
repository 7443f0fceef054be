#ifndef SOCIALGRAPH_GRAPH_LAYOUT_LAYOUT_ENGINE_H
#define SOCIALGRAPH_GRAPH_LAYOUT_LAYOUT_ENGINE_H

#include <socialgraph/graph/graph_types.h>

namespace socialgraph {
namespace graph {

/*
 * Initial node placement before physics relaxation.
 *
 * Every mode is a pure function of the ordered node list (seeded scatter or
 * index-derived angles). The subject is always placed at the origin and all
 * velocities are reset.
 */
class LayoutEngine {
public:
    struct LayoutParams {
        float scatter_min_radius;
        float scatter_max_radius;
        float circle_radius;
        unsigned int seed;

        LayoutParams();
    };

    explicit LayoutEngine(const LayoutParams& params = LayoutParams());

    void Apply(SocialGraph& graph, ViewMode mode) const;

    // Ring radius used by the hierarchy mode for a relationship type.
    static float RingRadius(NodeType type);

    const LayoutParams& GetParams() const { return params_; }

private:
    void ApplyNetwork(SocialGraph& graph) const;
    void ApplyCircle(SocialGraph& graph) const;
    void ApplyHierarchy(SocialGraph& graph) const;

    LayoutParams params_;
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_LAYOUT_LAYOUT_ENGINE_H
