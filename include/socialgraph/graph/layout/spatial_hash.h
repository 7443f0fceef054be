#ifndef SOCIALGRAPH_GRAPH_LAYOUT_SPATIAL_HASH_H
#define SOCIALGRAPH_GRAPH_LAYOUT_SPATIAL_HASH_H

#include <imgui.h>
#include <socialgraph/graph/graph_types.h>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace socialgraph {
namespace graph {

namespace detail {
// Pack 2D grid cell coordinates into a 64-bit key for unordered_map buckets
constexpr uint64_t PackCell(int32_t x, int32_t y) {
    return (static_cast<uint64_t>(static_cast<uint32_t>(x)) << 32) |
           static_cast<uint32_t>(y);
}

float Distance(const ImVec2& a, const ImVec2& b);
ImVec2 Normalize(const ImVec2& vec);
} // namespace detail

// Uniform grid over node positions for neighbour queries during repulsion.
// Query results are indices into the vector passed to the last Insert().
class SpatialHash {
public:
    explicit SpatialHash(float cell_size);

    void Insert(const std::vector<GraphNode>& nodes);
    std::vector<int> Query(const ImVec2& position, float radius) const;

    float GetCellSize() const { return cell_size_; }

private:
    int32_t CellCoord(float value) const;

    float cell_size_;
    std::unordered_map<uint64_t, std::vector<int>> buckets_;
    bool populated_ = false;
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_LAYOUT_SPATIAL_HASH_H
