#include <socialgraph/graph/data/graph_data_builder.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <numeric>
#include <random>

namespace socialgraph {
namespace graph {

namespace {

// Slot apportionment order; also the tie-break order for equal remainders.
constexpr std::array<NodeType, 4> kAlterTypes = {
    NodeType::Friend, NodeType::Mutual, NodeType::Following, NodeType::Follower};

struct StrengthBand {
    float min;
    float max;
};

StrengthBand StrengthBandFor(NodeType type) {
    switch (type) {
        case NodeType::Friend:    return {0.7f, 1.0f};
        case NodeType::Mutual:    return {0.5f, 0.9f};
        case NodeType::Following: return {0.3f, 0.7f};
        case NodeType::Follower:  return {0.2f, 0.6f};
        case NodeType::Self:      break;
    }
    return {0.5f, 0.5f};
}

std::string MakeAvatar(const std::string& label) {
    for (char c : label) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return "?";
}

size_t TypeSlot(NodeType type) {
    auto it = std::find(kAlterTypes.begin(), kAlterTypes.end(), type);
    return static_cast<size_t>(std::distance(kAlterTypes.begin(), it));
}

} // namespace

RelationshipData FallbackRelationshipData() {
    RelationshipData data;
    data.stats.total_connections = 150;
    data.stats.followers = 75;
    data.stats.following = 50;
    data.stats.mutual_connections = 25;
    data.mutual_connections.reserve(25);
    for (int i = 0; i < 25; ++i) {
        MutualConnection connection;
        connection.id = "user_" + std::to_string(i);
        connection.username = "user" + std::to_string(i);
        data.mutual_connections.push_back(std::move(connection));
    }
    return data;
}

int SlotAllocation::For(NodeType type) const {
    switch (type) {
        case NodeType::Friend:    return friends;
        case NodeType::Mutual:    return mutual;
        case NodeType::Following: return following;
        case NodeType::Follower:  return followers;
        case NodeType::Self:      break;
    }
    return 0;
}

GraphDataBuilder::BuildParams::BuildParams()
    : max_visible_nodes(29),
      seed(123) {}

GraphDataBuilder::GraphDataBuilder(const BuildParams& params) : params_(params) {}

SlotAllocation GraphDataBuilder::AllocateSlots(const NetworkStats& stats, int slots) {
    SlotAllocation allocation;
    if (slots <= 0) return allocation;

    const long long followers = std::max(0, stats.followers);
    const long long following = std::max(0, stats.following);
    const long long mutual = std::max(0, stats.mutual_connections);
    const long long friends = std::max(0LL, static_cast<long long>(stats.total_connections) - followers - following - mutual);

    // Weights in kAlterTypes order.
    const std::array<long long, 4> weights = {friends, mutual, following, followers};
    const long long weight_sum = std::accumulate(weights.begin(), weights.end(), 0LL);
    if (weight_sum == 0) return allocation;

    // Never draw more nodes than there are real connections.
    const long long visible = std::min<long long>(slots, weight_sum);

    std::array<long long, 4> quotas{};
    std::array<long long, 4> remainders{};
    long long assigned = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        quotas[i] = visible * weights[i] / weight_sum;
        remainders[i] = visible * weights[i] % weight_sum;
        assigned += quotas[i];
    }

    std::array<size_t, 4> order = {0, 1, 2, 3};
    std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
        return remainders[a] > remainders[b];
    });
    for (size_t k = 0; assigned < visible && k < order.size(); ++k) {
        ++quotas[order[k]];
        ++assigned;
    }

    allocation.friends = static_cast<int>(quotas[0]);
    allocation.mutual = static_cast<int>(quotas[1]);
    allocation.following = static_cast<int>(quotas[2]);
    allocation.followers = static_cast<int>(quotas[3]);
    return allocation;
}

SocialGraph GraphDataBuilder::Build(const RelationshipData& data, const std::string& subject_id, FilterType filter) const {
    SocialGraph full = BuildUnfiltered(data, subject_id);
    if (filter == FilterType::All) return full;
    return ApplyFilter(full, filter);
}

SocialGraph GraphDataBuilder::BuildUnfiltered(const RelationshipData& data, const std::string& subject_id) const {
    SocialGraph graph;
    std::mt19937 rng(params_.seed);
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    GraphNode subject;
    subject.id = subject_id.empty() ? NodeId(kDefaultSubjectId) : subject_id;
    subject.label = "You";
    subject.avatar = "You";
    subject.type = NodeType::Self;
    subject.fixed = true;
    subject.influence = 1.0f;
    subject.connection_count = std::max(0, data.stats.total_connections);
    const NodeId subject_key = graph.AddNode(std::move(subject)).id;

    const SlotAllocation allocation = AllocateSlots(data.stats, params_.max_visible_nodes - 1);

    std::array<std::vector<NodeId>, 4> groups;
    size_t next_identity = 0;
    for (NodeType type : kAlterTypes) {
        const int count = allocation.For(type);
        int synthetic = 0;
        for (int i = 0; i < count; ++i) {
            GraphNode node;
            node.type = type;

            if (type == NodeType::Mutual) {
                while (next_identity < data.mutual_connections.size()) {
                    const MutualConnection& identity = data.mutual_connections[next_identity++];
                    if (identity.id.empty() || graph.Contains(identity.id)) continue;
                    node.id = identity.id;
                    if (!identity.display_name.empty()) {
                        node.label = identity.display_name;
                    } else if (!identity.username.empty()) {
                        node.label = identity.username;
                    } else {
                        node.label = identity.id;
                    }
                    break;
                }
            }
            if (node.id.empty()) {
                do {
                    node.id = std::string(ToString(type)) + "_" + std::to_string(synthetic++);
                } while (graph.Contains(node.id));
                node.label = std::string(DisplayName(type)) + " " + std::to_string(synthetic);
            }

            node.avatar = MakeAvatar(node.label);
            node.influence = 0.2f + 0.7f * unit(rng);
            groups[TypeSlot(type)].push_back(node.id);
            graph.AddNode(std::move(node));
        }
    }

    auto connect = [&](const NodeId& a, const NodeId& b, NodeType type) {
        if (a == b || graph.HasEdge(a, b)) return;
        const StrengthBand band = StrengthBandFor(type);
        GraphEdge edge;
        edge.source_id = a;
        edge.target_id = b;
        edge.type = EdgeTypeFor(type);
        edge.strength = band.min + (band.max - band.min) * unit(rng);
        graph.AddEdge(std::move(edge));
    };

    // 1. Every alter is directly related to the subject.
    for (NodeType type : kAlterTypes) {
        for (const NodeId& id : groups[TypeSlot(type)]) {
            connect(subject_key, id, type);
        }
    }

    // 2. Members of one relationship type know each other (ring).
    for (NodeType type : kAlterTypes) {
        const auto& group = groups[TypeSlot(type)];
        if (group.size() == 2) {
            connect(group[0], group[1], type);
        } else if (group.size() >= 3) {
            for (size_t k = 0; k < group.size(); ++k) {
                connect(group[k], group[(k + 1) % group.size()], type);
            }
        }
    }

    // 3. Mutual connections bridge into the largest other cluster.
    const auto& mutual_group = groups[TypeSlot(NodeType::Mutual)];
    const std::vector<NodeId>* bridge_target = nullptr;
    for (NodeType type : kAlterTypes) {
        if (type == NodeType::Mutual) continue;
        const auto& group = groups[TypeSlot(type)];
        if (!group.empty() && (!bridge_target || group.size() > bridge_target->size())) {
            bridge_target = &group;
        }
    }
    if (bridge_target) {
        for (size_t i = 0; i < mutual_group.size(); ++i) {
            connect(mutual_group[i], (*bridge_target)[i % bridge_target->size()], NodeType::Mutual);
        }
    }

    for (auto& node : graph.GetNodes()) {
        if (!node.fixed) {
            node.connection_count = graph.Degree(node.id);
        }
    }
    return graph;
}

SocialGraph GraphDataBuilder::ApplyFilter(const SocialGraph& graph, FilterType filter) {
    const std::optional<NodeType> keep = NodeTypeFor(filter);
    if (!keep) return graph;

    SocialGraph filtered;
    for (const auto& node : graph.GetNodes()) {
        if (node.fixed || node.type == *keep) {
            filtered.AddNode(node);
        }
    }
    for (const auto& edge : graph.GetEdges()) {
        if (filtered.Contains(edge.source_id) && filtered.Contains(edge.target_id)) {
            filtered.AddEdge(edge);
        }
    }
    return filtered;
}

} // namespace graph
} // namespace socialgraph
