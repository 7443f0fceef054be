#pragma once

#include <imgui.h> // For ImU32
#include <socialgraph/graph/graph_types.h>

namespace socialgraph {
namespace graph {

// Graph palette and sizing shared by the renderer, hit-testing and the legend.
namespace GraphStyle {

ImU32 GetNodeColor(NodeType type);
ImU32 GetEdgeColor(EdgeType type, float strength);
float GetEdgeThickness(float strength);
ImU32 GetBackgroundColor();
ImU32 GetLabelColor();
ImU32 GetAvatarTextColor();
ImU32 GetHoverRingColor();
ImU32 GetSelectionRingColor();

// Rendered radius in simulation units: 8 + 12 * influence, 24 for the subject.
float GetNodeRadius(const GraphNode& node);

} // namespace GraphStyle

} // namespace graph
} // namespace socialgraph
