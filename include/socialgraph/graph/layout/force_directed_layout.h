#ifndef SOCIALGRAPH_GRAPH_LAYOUT_FORCE_DIRECTED_LAYOUT_H
#define SOCIALGRAPH_GRAPH_LAYOUT_FORCE_DIRECTED_LAYOUT_H

#include <vector>
#include <imgui.h>
#include <socialgraph/graph/graph_types.h>
#include <socialgraph/graph/layout/spatial_hash.h>

namespace socialgraph {
namespace graph {

struct SimulationContext;

/*
 * Iterative force integration relaxing an initial layout toward equilibrium.
 *
 * Per frame, for every non-fixed node: a center pull scaled by the force
 * strength, spring forces along incident edges, inverse-square repulsion
 * between nearby nodes, explicit integration and finally velocity damping.
 * The fixed subject accumulates no force and stays pinned at the origin.
 */
class ForceDirectedLayout {
public:
    struct LayoutParams {
        float center_strength;      // multiplied by the user force strength
        float link_strength;        // multiplied by the edge strength
        float ideal_edge_length;
        float repulsion_strength;
        float min_distance;         // repulsion clamp
        float repulsion_cutoff;     // repulsion fades to zero at this distance
        float damping_factor;
        float time_step;
        float max_force;
        float convergence_threshold; // max per-frame displacement

        LayoutParams();
    };

private:
    LayoutParams params_;
    SpatialHash spatial_hash_;
    std::vector<ImVec2> forces_;
    bool is_settled_ = false;
    int current_iteration_ = 0;
    friend struct ForceDirectedLayoutDetail;

public:
    explicit ForceDirectedLayout(const LayoutParams& params = LayoutParams());

    // Advances one frame when the context is Running. Returns true if the
    // simulation advanced.
    bool Update(SimulationContext& context);

    // Advances one frame unconditionally. Returns false once the layout has settled.
    bool UpdateLayout(SocialGraph& graph, float force_strength);

    // Sum of 0.5 * |v|^2 over non-fixed nodes.
    static float TotalKineticEnergy(const SocialGraph& graph);

    bool IsSettled() const { return is_settled_; }
    int GetIteration() const { return current_iteration_; }
    const LayoutParams& GetParams() const { return params_; }
    void ResetPhysicsState();
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_LAYOUT_FORCE_DIRECTED_LAYOUT_H
