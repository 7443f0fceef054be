#include "gtest/gtest.h"
#include "test_doubles.h"

#include <socialgraph/graph/data/graph_data_builder.h>
#include <socialgraph/graph/data/graph_stats.h>

using namespace socialgraph::graph;
using socialgraph::test_support::SampleRelationshipData;

TEST(GraphStatsTest, SampleDatasetReadout) {
    RelationshipData data = SampleRelationshipData();
    GraphDataBuilder builder;
    SocialGraph graph = builder.Build(data, "alice", FilterType::All);

    GraphStats stats = ComputeGraphStats(data.stats, graph);
    EXPECT_EQ(stats.total_connections, 150);
    EXPECT_EQ(stats.mutual_connections, 25);
    EXPECT_EQ(stats.clusters, 3);
    EXPECT_EQ(FormatDensity(stats.density), "15.0%");
}

TEST(GraphStatsTest, TotalsAreAggregatesNotNodeCounts) {
    RelationshipData data = SampleRelationshipData();
    GraphDataBuilder builder;
    SocialGraph followers = builder.Build(data, "alice", FilterType::Followers);

    GraphStats stats = ComputeGraphStats(data.stats, followers);
    EXPECT_EQ(stats.total_connections, 150);
    EXPECT_EQ(stats.mutual_connections, 25);
    EXPECT_EQ(stats.clusters, 1);
}

TEST(GraphStatsTest, DensityOfSmallGraphs) {
    SocialGraph empty;
    EXPECT_DOUBLE_EQ(ComputeDensity(empty), 0.0);

    SocialGraph pair;
    GraphNode a;
    a.id = "a";
    GraphNode b;
    b.id = "b";
    pair.AddNode(a);
    pair.AddNode(b);
    EXPECT_DOUBLE_EQ(ComputeDensity(pair), 0.0);

    GraphEdge edge;
    edge.source_id = "a";
    edge.target_id = "b";
    pair.AddEdge(edge);
    EXPECT_DOUBLE_EQ(ComputeDensity(pair), 1.0);
    EXPECT_EQ(FormatDensity(ComputeDensity(pair)), "100.0%");
}

TEST(GraphStatsTest, SingletonTypesAreNotClusters) {
    SocialGraph graph;
    GraphNode me;
    me.id = "me";
    me.type = NodeType::Self;
    me.fixed = true;
    graph.AddNode(me);
    for (const char* id : {"f1", "f2"}) {
        GraphNode n;
        n.id = id;
        n.type = NodeType::Friend;
        graph.AddNode(n);
    }
    GraphNode lone;
    lone.id = "lone";
    lone.type = NodeType::Follower;
    graph.AddNode(lone);

    EXPECT_EQ(CountClusters(graph), 1);
}

TEST(GraphStatsTest, FormatsOneDecimal) {
    EXPECT_EQ(FormatDensity(0.0), "0.0%");
    EXPECT_EQ(FormatDensity(0.12345), "12.3%");
}
