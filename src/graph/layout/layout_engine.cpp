#include <socialgraph/graph/layout/layout_engine.h>

#include <array>
#include <cmath>
#include <random>

namespace socialgraph {
namespace graph {

namespace {
constexpr float kTwoPi = 6.28318530718f;

// Hierarchy rings from the center outwards.
constexpr std::array<NodeType, 4> kRingOrder = {
    NodeType::Friend, NodeType::Mutual, NodeType::Following, NodeType::Follower};
} // namespace

LayoutEngine::LayoutParams::LayoutParams()
    : scatter_min_radius(60.0f),
      scatter_max_radius(220.0f),
      circle_radius(200.0f),
      seed(123) {}

LayoutEngine::LayoutEngine(const LayoutParams& params) : params_(params) {}

float LayoutEngine::RingRadius(NodeType type) {
    switch (type) {
        case NodeType::Self:      return 0.0f;
        case NodeType::Friend:    return 100.0f;
        case NodeType::Mutual:    return 170.0f;
        case NodeType::Following: return 240.0f;
        case NodeType::Follower:  return 310.0f;
    }
    return 0.0f;
}

void LayoutEngine::Apply(SocialGraph& graph, ViewMode mode) const {
    switch (mode) {
        case ViewMode::Network:   ApplyNetwork(graph); break;
        case ViewMode::Circle:    ApplyCircle(graph); break;
        case ViewMode::Hierarchy: ApplyHierarchy(graph); break;
    }

    for (auto& node : graph.GetNodes()) {
        node.velocity = ImVec2(0.0f, 0.0f);
        if (node.fixed) {
            node.position = ImVec2(0.0f, 0.0f);
        }
    }
}

void LayoutEngine::ApplyNetwork(SocialGraph& graph) const {
    // A fresh generator per call keeps the scatter identical for the same node list.
    std::mt19937 rng(params_.seed);
    std::uniform_real_distribution<float> angle_dist(0.0f, kTwoPi);
    std::uniform_real_distribution<float> radius_dist(params_.scatter_min_radius, params_.scatter_max_radius);

    for (auto& node : graph.GetNodes()) {
        if (node.fixed) continue;
        float angle = angle_dist(rng);
        float radius = radius_dist(rng);
        node.position = ImVec2(std::cos(angle) * radius, std::sin(angle) * radius);
    }
}

void LayoutEngine::ApplyCircle(SocialGraph& graph) const {
    size_t count = 0;
    for (const auto& node : graph.GetNodes()) {
        if (!node.fixed) ++count;
    }
    if (count == 0) return;

    size_t index = 0;
    for (auto& node : graph.GetNodes()) {
        if (node.fixed) continue;
        float angle = kTwoPi * static_cast<float>(index) / static_cast<float>(count);
        node.position = ImVec2(std::cos(angle) * params_.circle_radius,
                               std::sin(angle) * params_.circle_radius);
        ++index;
    }
}

void LayoutEngine::ApplyHierarchy(SocialGraph& graph) const {
    for (size_t ring = 0; ring < kRingOrder.size(); ++ring) {
        const NodeType type = kRingOrder[ring];

        size_t count = 0;
        for (const auto& node : graph.GetNodes()) {
            if (!node.fixed && node.type == type) ++count;
        }
        if (count == 0) continue;

        const float radius = RingRadius(type);
        // Rotate successive rings so their first members do not line up.
        const float phase = 0.35f * static_cast<float>(ring);
        size_t index = 0;
        for (auto& node : graph.GetNodes()) {
            if (node.fixed || node.type != type) continue;
            float angle = phase + kTwoPi * static_cast<float>(index) / static_cast<float>(count);
            node.position = ImVec2(std::cos(angle) * radius, std::sin(angle) * radius);
            ++index;
        }
    }
}

} // namespace graph
} // namespace socialgraph
