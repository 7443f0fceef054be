#include <socialgraph/graph/data/graph_loader.h>

#include <chrono>
#include <iostream>

namespace socialgraph {
namespace graph {

GraphLoader::GraphLoader(RelationshipSource& source, const GraphDataBuilder& builder)
    : source_(source), builder_(builder) {}

GraphLoader::~GraphLoader() {
    WaitForIdle();
}

std::uint64_t GraphLoader::Request(const std::string& subject_id, FilterType filter) {
    const std::uint64_t generation = ++latest_generation_;
    pending_.push_back(std::async(std::launch::async, [this, generation, subject_id, filter] {
        return Load(generation, subject_id, filter);
    }));
    return generation;
}

LoadResult GraphLoader::Load(std::uint64_t generation, std::string subject_id, FilterType filter) const {
    LoadResult result;
    result.generation = generation;
    result.subject_id = std::move(subject_id);
    result.filter = filter;

    // Both fetches run concurrently; the graph is built once both have settled.
    auto stats_future = std::async(std::launch::async, [this, &result] {
        return source_.GetNetworkStats(result.subject_id);
    });
    auto mutual_future = std::async(std::launch::async, [this, &result] {
        return source_.GetMutualConnections(result.subject_id, kMaxMutualConnections);
    });

    RelationshipData data;
    std::string errors;
    try {
        data.stats = stats_future.get();
    } catch (const std::exception& e) {
        errors = e.what();
    } catch (...) {
        errors = "network stats request failed with a non-standard exception";
    }
    try {
        data.mutual_connections = mutual_future.get();
    } catch (const std::exception& e) {
        if (!errors.empty()) errors += "; ";
        errors += e.what();
    } catch (...) {
        if (!errors.empty()) errors += "; ";
        errors += "mutual connections request failed with a non-standard exception";
    }

    if (!errors.empty()) {
        data = FallbackRelationshipData();
        result.used_fallback = true;
        result.error_detail = errors;
    }

    result.network_stats = data.stats;
    result.graph = builder_.Build(data, result.subject_id, filter);
    result.stats = ComputeGraphStats(data.stats, result.graph);
    return result;
}

std::optional<LoadResult> GraphLoader::Poll() {
    std::optional<LoadResult> latest;
    const std::uint64_t current = latest_generation_.load();

    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }
        try {
            LoadResult result = it->get();
            if (result.generation == current) {
                delivered_generation_ = result.generation;
                latest = std::move(result);
            } else {
                std::cout << "Discarding stale graph for '" << result.subject_id
                          << "' (request " << result.generation << ", current " << current << ")" << std::endl;
            }
        } catch (const std::exception& e) {
            std::cerr << "Graph load failed: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Graph load failed with a non-standard exception" << std::endl;
        }
        it = pending_.erase(it);
    }
    return latest;
}

bool GraphLoader::IsLoading() const {
    return delivered_generation_ != latest_generation_.load();
}

void GraphLoader::WaitForIdle() {
    for (auto& future : pending_) {
        if (future.valid()) future.wait();
    }
}

} // namespace graph
} // namespace socialgraph
