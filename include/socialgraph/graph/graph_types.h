#ifndef SOCIALGRAPH_GRAPH_GRAPH_TYPES_H
#define SOCIALGRAPH_GRAPH_GRAPH_TYPES_H

#include <imgui.h> // ImVec2
#include <socialgraph/core/id_types.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace socialgraph {
namespace graph {

enum class NodeType {
    Self,
    Friend,
    Follower,
    Following,
    Mutual
};

enum class EdgeType {
    Friend,
    Follower,
    Following,
    Mutual
};

// Initial layout strategy applied before physics relaxation.
enum class ViewMode {
    Network,
    Circle,
    Hierarchy
};

enum class FilterType {
    All,
    Friends,
    Followers,
    Following
};

const char* ToString(NodeType type);
const char* ToString(EdgeType type);
const char* ToString(ViewMode mode);
const char* ToString(FilterType filter);

// Human readable names used by the control surface ("All Connections", ...).
const char* DisplayName(NodeType type);
const char* DisplayName(ViewMode mode);
const char* DisplayName(FilterType filter);

std::optional<ViewMode> ParseViewMode(std::string_view text);
std::optional<FilterType> ParseFilterType(std::string_view text);

// Edge type carried by the edge joining the subject to a node of this type.
// Throws std::invalid_argument for NodeType::Self.
EdgeType EdgeTypeFor(NodeType type);

// Node type kept by a filter, std::nullopt for FilterType::All.
std::optional<NodeType> NodeTypeFor(FilterType filter);

struct GraphNode {
    NodeId id;
    std::string label;
    std::string avatar;                    // short glyph drawn inside the node
    NodeType type = NodeType::Friend;
    ImVec2 position = ImVec2(0.0f, 0.0f);  // simulation space
    ImVec2 velocity = ImVec2(0.0f, 0.0f);
    bool fixed = false;                    // only ever true for the subject
    float influence = 0.0f;                // [0,1], drives render radius
    int connection_count = 0;
};

struct GraphEdge {
    NodeId source_id;
    NodeId target_id;
    EdgeType type = EdgeType::Friend;
    float strength = 0.0f;                 // [0,1]
};

/*
 * Node/edge container for one (subject, filter) combination.
 *
 * Nodes keep insertion order (layout and hit-testing depend on it) and are
 * indexed by id. The class enforces the structural invariants on insertion:
 * unique ids, a single fixed subject pinned at the origin, edges that only
 * reference known nodes, and strength/influence clamped to [0,1].
 * Violations throw std::invalid_argument.
 */
class SocialGraph {
public:
    GraphNode& AddNode(GraphNode node);
    void AddEdge(GraphEdge edge);

    bool HasEdge(const NodeId& a, const NodeId& b) const;
    bool Contains(const NodeId& id) const;

    const GraphNode* FindNode(const NodeId& id) const;
    GraphNode* FindNode(const NodeId& id);

    const GraphNode* GetSubject() const;
    GraphNode* GetSubject();

    // Positions and velocities are mutable; ids and types must not be changed.
    std::vector<GraphNode>& GetNodes() { return nodes_; }
    const std::vector<GraphNode>& GetNodes() const { return nodes_; }
    const std::vector<GraphEdge>& GetEdges() const { return edges_; }

    std::optional<std::size_t> IndexOf(const NodeId& id) const;
    int Degree(const NodeId& id) const;

    std::size_t NodeCount() const { return nodes_.size(); }
    std::size_t EdgeCount() const { return edges_.size(); }
    bool Empty() const { return nodes_.empty(); }

private:
    std::vector<GraphNode> nodes_;
    std::vector<GraphEdge> edges_;
    std::unordered_map<NodeId, std::size_t> index_;
    std::optional<std::size_t> subject_index_;
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_GRAPH_TYPES_H
