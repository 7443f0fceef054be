#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace socialgraph {
namespace graph {

// Upper bound on the mutual-connection identities requested per load.
inline constexpr int kMaxMutualConnections = 50;

// Aggregate relationship counts for one subject. These are the true totals
// shown in the stats readout, independent of how many nodes are drawn.
struct NetworkStats {
    int total_connections = 0;
    int followers = 0;
    int following = 0;
    int mutual_connections = 0;
};

struct MutualConnection {
    std::string id;
    std::string username;
    std::string display_name;
};

struct RelationshipData {
    NetworkStats stats;
    std::vector<MutualConnection> mutual_connections;
};

// Raised by a RelationshipSource when data for a subject cannot be obtained.
class DataFetchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/*
 * Provider of relationship data for a subject. Implementations must be safe to
 * call from worker threads; the loader issues both calls concurrently.
 */
class RelationshipSource {
public:
    virtual ~RelationshipSource() = default;

    virtual NetworkStats GetNetworkStats(const std::string& subject_id) = 0;
    virtual std::vector<MutualConnection> GetMutualConnections(const std::string& subject_id, int max_count) = 0;
};

} // namespace graph
} // namespace socialgraph
