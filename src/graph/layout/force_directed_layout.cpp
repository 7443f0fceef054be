#include <socialgraph/graph/layout/force_directed_layout.h>
#include <socialgraph/graph/layout/spatial_hash.h>
#include <socialgraph/graph/simulation_context.h>

#include <algorithm>
#include <cmath>

namespace socialgraph {
namespace graph {

// Bring math helpers from SpatialHash detail into this file's scope
using detail::Distance;
using detail::Normalize;

namespace {
ImVec2 ClampMagnitude(const ImVec2& v, float max_length) {
    float length = std::sqrt(v.x * v.x + v.y * v.y);
    if (length <= max_length || length <= 0.0f) return v;
    float scale = max_length / length;
    return ImVec2(v.x * scale, v.y * scale);
}
} // namespace

struct ForceDirectedLayoutDetail {
    static void CalculateCenterForces(ForceDirectedLayout& layout, const SocialGraph& graph, float force_strength) {
        const auto& nodes = graph.GetNodes();
        const float k = layout.params_.center_strength * force_strength;
        for (size_t i = 0; i < nodes.size(); ++i) {
            if (nodes[i].fixed) continue;
            layout.forces_[i].x -= nodes[i].position.x * k;
            layout.forces_[i].y -= nodes[i].position.y * k;
        }
    }

    static void CalculateSpringForces(ForceDirectedLayout& layout, const SocialGraph& graph) {
        const auto& nodes = graph.GetNodes();
        for (const auto& edge : graph.GetEdges()) {
            auto source_idx = graph.IndexOf(edge.source_id);
            auto target_idx = graph.IndexOf(edge.target_id);
            if (!source_idx || !target_idx) continue;

            const GraphNode& source = nodes[*source_idx];
            const GraphNode& target = nodes[*target_idx];

            ImVec2 delta = ImVec2(target.position.x - source.position.x,
                                  target.position.y - source.position.y);
            float distance = Distance(source.position, target.position);
            if (distance < 0.1f) continue;

            // Positive when stretched: pulls the endpoints together.
            float force_magnitude = layout.params_.link_strength *
                                    (distance - layout.params_.ideal_edge_length) * edge.strength;
            force_magnitude = std::max(-layout.params_.max_force, std::min(layout.params_.max_force, force_magnitude));

            ImVec2 direction = Normalize(delta);
            ImVec2 spring_force = ImVec2(direction.x * force_magnitude, direction.y * force_magnitude);

            if (!source.fixed) {
                layout.forces_[*source_idx].x += spring_force.x;
                layout.forces_[*source_idx].y += spring_force.y;
            }
            if (!target.fixed) {
                layout.forces_[*target_idx].x -= spring_force.x;
                layout.forces_[*target_idx].y -= spring_force.y;
            }
        }
    }

    static void CalculateRepulsiveForces(ForceDirectedLayout& layout, const SocialGraph& graph) {
        const auto& nodes = graph.GetNodes();
        if (nodes.size() < 2) return;

        const float cutoff = layout.params_.repulsion_cutoff;
        layout.spatial_hash_.Insert(nodes);

        for (size_t i = 0; i < nodes.size(); ++i) {
            const GraphNode& node1 = nodes[i];
            std::vector<int> neighbors_indices = layout.spatial_hash_.Query(node1.position, cutoff);

            for (int j_index : neighbors_indices) {
                if (j_index <= static_cast<int>(i)) continue;
                const GraphNode& node2 = nodes[j_index];
                if (node1.fixed && node2.fixed) continue;

                ImVec2 delta = ImVec2(node2.position.x - node1.position.x,
                                      node2.position.y - node1.position.y);
                float distance = Distance(node1.position, node2.position);
                if (distance >= cutoff) continue;

                ImVec2 direction = Normalize(delta);
                if (direction.x == 0.0f && direction.y == 0.0f) {
                    // Coincident nodes: separate along an index-derived direction.
                    float angle = static_cast<float>(i * 7 + static_cast<size_t>(j_index));
                    direction = ImVec2(std::cos(angle), std::sin(angle));
                }

                // Inverse-square falloff tapered to zero at the cutoff so the
                // force stays continuous.
                float clamped = std::max(distance, layout.params_.min_distance);
                float force_magnitude = layout.params_.repulsion_strength / (clamped * clamped);
                force_magnitude *= (1.0f - distance / cutoff);
                force_magnitude = std::min(force_magnitude, layout.params_.max_force);

                ImVec2 repulsive_force = ImVec2(direction.x * force_magnitude,
                                                direction.y * force_magnitude);

                if (!node1.fixed) {
                    layout.forces_[i].x -= repulsive_force.x;
                    layout.forces_[i].y -= repulsive_force.y;
                }
                if (!node2.fixed) {
                    layout.forces_[j_index].x += repulsive_force.x;
                    layout.forces_[j_index].y += repulsive_force.y;
                }
            }
        }
    }

    // Integrates and damps; returns the largest displacement of the frame.
    static float ApplyForces(ForceDirectedLayout& layout, SocialGraph& graph) {
        auto& nodes = graph.GetNodes();
        const float dt = layout.params_.time_step;
        float max_displacement = 0.0f;

        for (size_t i = 0; i < nodes.size(); ++i) {
            GraphNode& node = nodes[i];
            if (node.fixed) {
                node.velocity = ImVec2(0.0f, 0.0f);
                node.position = ImVec2(0.0f, 0.0f);
                continue;
            }

            ImVec2 force = ClampMagnitude(layout.forces_[i], layout.params_.max_force);

            node.velocity.x += force.x * dt;
            node.velocity.y += force.y * dt;

            float dx = node.velocity.x * dt;
            float dy = node.velocity.y * dt;
            node.position.x += dx;
            node.position.y += dy;

            node.velocity.x *= layout.params_.damping_factor;
            node.velocity.y *= layout.params_.damping_factor;

            max_displacement = std::max(max_displacement, std::sqrt(dx * dx + dy * dy));
        }
        return max_displacement;
    }
};

ForceDirectedLayout::LayoutParams::LayoutParams()
    : center_strength(0.01f),
      link_strength(0.02f),
      ideal_edge_length(90.0f),
      repulsion_strength(2000.0f),
      min_distance(20.0f),
      repulsion_cutoff(400.0f),
      damping_factor(0.85f),
      time_step(1.0f),
      max_force(50.0f),
      convergence_threshold(0.05f) {}

ForceDirectedLayout::ForceDirectedLayout(const LayoutParams& params)
    : params_(params), spatial_hash_(params.repulsion_cutoff) {}

bool ForceDirectedLayout::Update(SimulationContext& context) {
    if (!context.IsRunning()) return false;
    UpdateLayout(context.graph, context.settings.force_strength);
    return true;
}

bool ForceDirectedLayout::UpdateLayout(SocialGraph& graph, float force_strength) {
    auto& nodes = graph.GetNodes();
    if (nodes.empty()) {
        is_settled_ = true;
        return false;
    }

    forces_.assign(nodes.size(), ImVec2(0.0f, 0.0f));
    const float strength = SnapForceStrength(force_strength);

    ForceDirectedLayoutDetail::CalculateCenterForces(*this, graph, strength);
    ForceDirectedLayoutDetail::CalculateSpringForces(*this, graph);
    ForceDirectedLayoutDetail::CalculateRepulsiveForces(*this, graph);
    float max_displacement = ForceDirectedLayoutDetail::ApplyForces(*this, graph);

    ++current_iteration_;
    is_settled_ = max_displacement < params_.convergence_threshold;
    return !is_settled_;
}

float ForceDirectedLayout::TotalKineticEnergy(const SocialGraph& graph) {
    float energy = 0.0f;
    for (const auto& node : graph.GetNodes()) {
        if (node.fixed) continue;
        energy += 0.5f * (node.velocity.x * node.velocity.x + node.velocity.y * node.velocity.y);
    }
    return energy;
}

void ForceDirectedLayout::ResetPhysicsState() {
    forces_.clear();
    is_settled_ = false;
    current_iteration_ = 0;
}

} // namespace graph
} // namespace socialgraph
