#include <socialgraph/graph/data/graph_stats.h>

#include <iomanip>
#include <map>
#include <sstream>

namespace socialgraph {
namespace graph {

GraphStats ComputeGraphStats(const NetworkStats& stats, const SocialGraph& graph) {
    GraphStats result;
    result.total_connections = stats.total_connections;
    result.mutual_connections = stats.mutual_connections;
    result.clusters = CountClusters(graph);
    result.density = ComputeDensity(graph);
    return result;
}

double ComputeDensity(const SocialGraph& graph) {
    const double n = static_cast<double>(graph.NodeCount());
    if (n < 2.0) return 0.0;
    return (2.0 * static_cast<double>(graph.EdgeCount())) / (n * (n - 1.0));
}

int CountClusters(const SocialGraph& graph) {
    std::map<NodeType, int> group_sizes;
    for (const auto& node : graph.GetNodes()) {
        if (node.type == NodeType::Self) continue;
        ++group_sizes[node.type];
    }
    int clusters = 0;
    for (const auto& [type, size] : group_sizes) {
        if (size >= 2) ++clusters;
    }
    return clusters;
}

std::string FormatDensity(double density) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << density * 100.0 << '%';
    return out.str();
}

} // namespace graph
} // namespace socialgraph
