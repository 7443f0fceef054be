#include <socialgraph/graph/graph_types.h>

#include <algorithm>
#include <stdexcept>

namespace socialgraph {
namespace graph {

const char* ToString(NodeType type) {
    switch (type) {
        case NodeType::Self:      return "self";
        case NodeType::Friend:    return "friend";
        case NodeType::Follower:  return "follower";
        case NodeType::Following: return "following";
        case NodeType::Mutual:    return "mutual";
    }
    return "unknown";
}

const char* ToString(EdgeType type) {
    switch (type) {
        case EdgeType::Friend:    return "friend";
        case EdgeType::Follower:  return "follower";
        case EdgeType::Following: return "following";
        case EdgeType::Mutual:    return "mutual";
    }
    return "unknown";
}

const char* ToString(ViewMode mode) {
    switch (mode) {
        case ViewMode::Network:   return "network";
        case ViewMode::Circle:    return "circle";
        case ViewMode::Hierarchy: return "hierarchy";
    }
    return "network";
}

const char* ToString(FilterType filter) {
    switch (filter) {
        case FilterType::All:       return "all";
        case FilterType::Friends:   return "friends";
        case FilterType::Followers: return "followers";
        case FilterType::Following: return "following";
    }
    return "all";
}

const char* DisplayName(NodeType type) {
    switch (type) {
        case NodeType::Self:      return "You";
        case NodeType::Friend:    return "Friend";
        case NodeType::Follower:  return "Follower";
        case NodeType::Following: return "Following";
        case NodeType::Mutual:    return "Mutual";
    }
    return "Unknown";
}

const char* DisplayName(ViewMode mode) {
    switch (mode) {
        case ViewMode::Network:   return "Network";
        case ViewMode::Circle:    return "Circle";
        case ViewMode::Hierarchy: return "Hierarchy";
    }
    return "Network";
}

const char* DisplayName(FilterType filter) {
    switch (filter) {
        case FilterType::All:       return "All Connections";
        case FilterType::Friends:   return "Friends";
        case FilterType::Followers: return "Followers";
        case FilterType::Following: return "Following";
    }
    return "All Connections";
}

std::optional<ViewMode> ParseViewMode(std::string_view text) {
    for (ViewMode mode : {ViewMode::Network, ViewMode::Circle, ViewMode::Hierarchy}) {
        if (text == ToString(mode)) return mode;
    }
    return std::nullopt;
}

std::optional<FilterType> ParseFilterType(std::string_view text) {
    for (FilterType filter : {FilterType::All, FilterType::Friends, FilterType::Followers, FilterType::Following}) {
        if (text == ToString(filter)) return filter;
    }
    return std::nullopt;
}

EdgeType EdgeTypeFor(NodeType type) {
    switch (type) {
        case NodeType::Friend:    return EdgeType::Friend;
        case NodeType::Follower:  return EdgeType::Follower;
        case NodeType::Following: return EdgeType::Following;
        case NodeType::Mutual:    return EdgeType::Mutual;
        case NodeType::Self:      break;
    }
    throw std::invalid_argument("The subject node has no relationship edge type");
}

std::optional<NodeType> NodeTypeFor(FilterType filter) {
    switch (filter) {
        case FilterType::Friends:   return NodeType::Friend;
        case FilterType::Followers: return NodeType::Follower;
        case FilterType::Following: return NodeType::Following;
        case FilterType::All:       break;
    }
    return std::nullopt;
}

GraphNode& SocialGraph::AddNode(GraphNode node) {
    if (node.id.empty()) {
        throw std::invalid_argument("Graph node id must not be empty");
    }
    if (index_.count(node.id) != 0) {
        throw std::invalid_argument("Duplicate graph node id: " + node.id);
    }
    if (node.fixed) {
        if (subject_index_.has_value()) {
            throw std::invalid_argument("Graph already has a fixed subject node: " + nodes_[*subject_index_].id);
        }
        node.position = ImVec2(0.0f, 0.0f);
        node.velocity = ImVec2(0.0f, 0.0f);
    }
    node.influence = std::clamp(node.influence, 0.0f, 1.0f);
    node.connection_count = std::max(0, node.connection_count);

    const std::size_t idx = nodes_.size();
    index_.emplace(node.id, idx);
    if (node.fixed) subject_index_ = idx;
    nodes_.push_back(std::move(node));
    return nodes_.back();
}

void SocialGraph::AddEdge(GraphEdge edge) {
    if (!Contains(edge.source_id) || !Contains(edge.target_id)) {
        throw std::invalid_argument("Edge references unknown node: " + edge.source_id + " -> " + edge.target_id);
    }
    if (edge.source_id == edge.target_id) {
        throw std::invalid_argument("Self-loop edges are not supported: " + edge.source_id);
    }
    edge.strength = std::clamp(edge.strength, 0.0f, 1.0f);
    edges_.push_back(std::move(edge));
}

bool SocialGraph::HasEdge(const NodeId& a, const NodeId& b) const {
    return std::any_of(edges_.begin(), edges_.end(), [&](const GraphEdge& e) {
        return (e.source_id == a && e.target_id == b) || (e.source_id == b && e.target_id == a);
    });
}

bool SocialGraph::Contains(const NodeId& id) const {
    return index_.find(id) != index_.end();
}

const GraphNode* SocialGraph::FindNode(const NodeId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

GraphNode* SocialGraph::FindNode(const NodeId& id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &nodes_[it->second];
}

const GraphNode* SocialGraph::GetSubject() const {
    return subject_index_ ? &nodes_[*subject_index_] : nullptr;
}

GraphNode* SocialGraph::GetSubject() {
    return subject_index_ ? &nodes_[*subject_index_] : nullptr;
}

std::optional<std::size_t> SocialGraph::IndexOf(const NodeId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

int SocialGraph::Degree(const NodeId& id) const {
    return static_cast<int>(std::count_if(edges_.begin(), edges_.end(), [&](const GraphEdge& e) {
        return e.source_id == id || e.target_id == id;
    }));
}

} // namespace graph
} // namespace socialgraph
