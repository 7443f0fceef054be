#include <socialgraph/graph/render/graph_style.h>

#include <algorithm>

namespace socialgraph {
namespace graph {
namespace GraphStyle {

ImU32 GetNodeColor(NodeType type) {
    switch (type) {
        case NodeType::Self:      return IM_COL32(255, 255, 255, 255);
        case NodeType::Friend:    return IM_COL32(0, 255, 136, 255);   // #00FF88
        case NodeType::Follower:  return IM_COL32(77, 166, 255, 255);  // #4DA6FF
        case NodeType::Following: return IM_COL32(255, 140, 66, 255);  // #FF8C42
        case NodeType::Mutual:    return IM_COL32(178, 102, 255, 255); // #B266FF
    }
    return IM_COL32(200, 200, 200, 255);
}

ImU32 GetEdgeColor(EdgeType type, float strength) {
    const float s = std::clamp(strength, 0.0f, 1.0f);
    const int alpha = static_cast<int>((0.25f + 0.75f * s) * 255.0f);
    switch (type) {
        case EdgeType::Friend:    return IM_COL32(0, 255, 136, alpha);
        case EdgeType::Follower:  return IM_COL32(77, 166, 255, alpha);
        case EdgeType::Following: return IM_COL32(255, 140, 66, alpha);
        case EdgeType::Mutual:    return IM_COL32(178, 102, 255, alpha);
    }
    return IM_COL32(200, 200, 200, alpha);
}

float GetEdgeThickness(float strength) {
    return 1.0f + 3.0f * std::clamp(strength, 0.0f, 1.0f);
}

ImU32 GetBackgroundColor() {
    return IM_COL32(12, 14, 24, 255);
}

ImU32 GetLabelColor() {
    return IM_COL32(230, 230, 235, 255);
}

ImU32 GetAvatarTextColor() {
    return IM_COL32(10, 10, 20, 255);
}

ImU32 GetHoverRingColor() {
    return IM_COL32(255, 255, 255, 160);
}

ImU32 GetSelectionRingColor() {
    return IM_COL32(255, 215, 0, 255);
}

float GetNodeRadius(const GraphNode& node) {
    if (node.fixed) return 24.0f;
    return 8.0f + 12.0f * std::clamp(node.influence, 0.0f, 1.0f);
}

} // namespace GraphStyle
} // namespace graph
} // namespace socialgraph
