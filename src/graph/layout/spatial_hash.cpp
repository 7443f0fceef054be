#include <socialgraph/graph/layout/spatial_hash.h>

#include <algorithm>
#include <cmath>

namespace socialgraph {
namespace graph {

namespace detail {
    float Distance(const ImVec2& a, const ImVec2& b) {
        float dx = b.x - a.x;
        float dy = b.y - a.y;
        return std::sqrt(dx * dx + dy * dy);
    }

    ImVec2 Normalize(const ImVec2& vec) {
        float length = std::sqrt(vec.x * vec.x + vec.y * vec.y);
        if (length > 0.001f) {
            return ImVec2(vec.x / length, vec.y / length);
        }
        return ImVec2(0.0f, 0.0f);
    }
} // namespace detail

SpatialHash::SpatialHash(float cell_size) : cell_size_(std::max(1.0f, cell_size)) {}

int32_t SpatialHash::CellCoord(float value) const {
    return static_cast<int32_t>(std::floor(value / cell_size_));
}

void SpatialHash::Insert(const std::vector<GraphNode>& nodes) {
    buckets_.clear();
    buckets_.reserve(nodes.size() * 2);

    for (size_t idx = 0; idx < nodes.size(); ++idx) {
        const ImVec2& p = nodes[idx].position;
        buckets_[detail::PackCell(CellCoord(p.x), CellCoord(p.y))].push_back(static_cast<int>(idx));
    }
    populated_ = true;
}

std::vector<int> SpatialHash::Query(const ImVec2& position, float radius) const {
    if (!populated_) return {};

    std::vector<int> result;
    const int32_t min_x = CellCoord(position.x - radius);
    const int32_t max_x = CellCoord(position.x + radius);
    const int32_t min_y = CellCoord(position.y - radius);
    const int32_t max_y = CellCoord(position.y + radius);

    for (int32_t cx = min_x; cx <= max_x; ++cx) {
        for (int32_t cy = min_y; cy <= max_y; ++cy) {
            auto bucket = buckets_.find(detail::PackCell(cx, cy));
            if (bucket == buckets_.end()) continue;
            result.insert(result.end(), bucket->second.begin(), bucket->second.end());
        }
    }
    return result;
}

} // namespace graph
} // namespace socialgraph
