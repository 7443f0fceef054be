#pragma once

#include <socialgraph/graph/data/graph_data_builder.h>
#include <socialgraph/graph/data/graph_stats.h>
#include <socialgraph/graph/data/relationship_source.h>
#include <socialgraph/graph/graph_types.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace socialgraph {
namespace graph {

struct LoadResult {
    std::uint64_t generation = 0;
    std::string subject_id;
    FilterType filter = FilterType::All;
    NetworkStats network_stats;
    SocialGraph graph;
    GraphStats stats;
    bool used_fallback = false;
    std::string error_detail;  // upstream failure when used_fallback is set
};

/*
 * Loads relationship data off the UI thread and builds the graph.
 *
 * Each Request() starts a worker that fetches stats and mutual connections
 * concurrently, waits for both, substitutes the fallback dataset when either
 * fails, and builds the graph. Poll() runs on the UI thread and hands over
 * only the result of the most recent request; results of superseded requests
 * are dropped (last-request-wins). The destructor waits for in-flight work.
 */
class GraphLoader {
public:
    GraphLoader(RelationshipSource& source, const GraphDataBuilder& builder);
    ~GraphLoader();

    GraphLoader(const GraphLoader&) = delete;
    GraphLoader& operator=(const GraphLoader&) = delete;

    std::uint64_t Request(const std::string& subject_id, FilterType filter);

    // Non-blocking. Returns the latest finished result, if any.
    std::optional<LoadResult> Poll();

    // True while the latest request has not been handed over by Poll().
    bool IsLoading() const;

    // Blocks until every in-flight worker has finished. Results stay queued for Poll().
    void WaitForIdle();

private:
    LoadResult Load(std::uint64_t generation, std::string subject_id, FilterType filter) const;

    RelationshipSource& source_;
    GraphDataBuilder builder_;
    std::atomic<std::uint64_t> latest_generation_{0};
    std::uint64_t delivered_generation_ = 0;
    std::vector<std::future<LoadResult>> pending_;
};

} // namespace graph
} // namespace socialgraph
