#pragma once

#include <socialgraph/graph/data/relationship_source.h>
#include <socialgraph/graph/graph_types.h>

#include <string>

namespace socialgraph {
namespace graph {

// Values shown in the stats readout.
struct GraphStats {
    int total_connections = 0;   // true aggregate, not the visible node count
    int mutual_connections = 0;  // true aggregate
    int clusters = 0;
    double density = 0.0;        // fraction in [0,1]
};

GraphStats ComputeGraphStats(const NetworkStats& stats, const SocialGraph& graph);

// Undirected density 2E / (N(N-1)) of the built graph; 0 for fewer than two nodes.
double ComputeDensity(const SocialGraph& graph);

// Number of relationship-type groups (subject excluded) with at least two nodes.
int CountClusters(const SocialGraph& graph);

// Formats a density fraction as a percentage with one decimal, e.g. "15.0%".
std::string FormatDensity(double density);

} // namespace graph
} // namespace socialgraph
