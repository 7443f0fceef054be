#pragma once

#include <socialgraph/graph/data/relationship_source.h>

#include <string>
#include <vector>

namespace socialgraph {
namespace graph {

/**
 * HttpRelationshipSource talks to the platform's social REST endpoints:
 * - GET {base}/social/{subject}/network-stats
 * - GET {base}/social/{subject}/mutual-connections?limit={n}
 * Every failure (transport, HTTP status, malformed payload) surfaces as
 * DataFetchError so the loader can apply its fallback.
 */
class HttpRelationshipSource : public RelationshipSource {
public:
    // An empty token sends no Authorization header.
    HttpRelationshipSource(std::string base_url, std::string bearer_token = "");

    NetworkStats GetNetworkStats(const std::string& subject_id) override;
    std::vector<MutualConnection> GetMutualConnections(const std::string& subject_id, int max_count) override;

    const std::string& GetBaseUrl() const { return base_url_; }

    // Resolves the base URL from SOCIALGRAPH_API_BASE_URL, falling back to the
    // compiled-in default.
    static std::string ResolveBaseUrl();
    // Reads SOCIALGRAPH_API_TOKEN, empty when unset.
    static std::string ResolveToken();

private:
    std::string Get(const std::string& url) const;

    std::string base_url_;
    std::string bearer_token_;
};

// Payload parsers, exposed for testing. Throw DataFetchError on malformed input.
NetworkStats ParseNetworkStats(const std::string& body);
std::vector<MutualConnection> ParseMutualConnections(const std::string& body);

} // namespace graph
} // namespace socialgraph
