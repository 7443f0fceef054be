#ifndef SOCIALGRAPH_GRAPH_DATA_GRAPH_DATA_BUILDER_H
#define SOCIALGRAPH_GRAPH_DATA_GRAPH_DATA_BUILDER_H

#include <socialgraph/graph/data/relationship_source.h>
#include <socialgraph/graph/graph_types.h>

#include <string>

namespace socialgraph {
namespace graph {

// Fixed dataset substituted when the relationship source fails: 150 total
// connections (75 followers, 50 following, 25 mutual) and identities
// user_0 .. user_24.
RelationshipData FallbackRelationshipData();

// Number of visible nodes given to each relationship type.
struct SlotAllocation {
    int friends = 0;
    int mutual = 0;
    int following = 0;
    int followers = 0;

    int Total() const { return friends + mutual + following + followers; }
    int For(NodeType type) const;
};

/*
 * Turns aggregate relationship data into a representative, size-capped graph.
 *
 * The subject sits at the center; the remaining visible slots are shared
 * between the relationship types in proportion to the aggregate counts. Edge
 * strengths and influences come from a seeded generator so a given input
 * always yields the same graph.
 */
class GraphDataBuilder {
public:
    struct BuildParams {
        int max_visible_nodes;  // including the subject
        unsigned int seed;

        BuildParams();
    };

    explicit GraphDataBuilder(const BuildParams& params = BuildParams());

    SocialGraph Build(const RelationshipData& data, const std::string& subject_id, FilterType filter) const;

    // Keeps the subject plus nodes of the filtered type and the edges between them.
    static SocialGraph ApplyFilter(const SocialGraph& graph, FilterType filter);

    // Largest-remainder split of `slots` over the relationship types.
    static SlotAllocation AllocateSlots(const NetworkStats& stats, int slots);

    const BuildParams& GetParams() const { return params_; }

private:
    SocialGraph BuildUnfiltered(const RelationshipData& data, const std::string& subject_id) const;

    BuildParams params_;
};

} // namespace graph
} // namespace socialgraph

#endif // SOCIALGRAPH_GRAPH_DATA_GRAPH_DATA_BUILDER_H
