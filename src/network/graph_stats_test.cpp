#include "network/graph_stats.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <limits>

using namespace transitgraph;
using ::testing::DoubleEq;
using ::testing::IsEmpty;
using ::testing::Pair;
using ::testing::UnorderedElementsAre;

namespace {

TransitGraph MakeStar() {
  std::vector<StationNode> nodes;
  for (const char* id : {"Hub", "North", "East", "South", "Lonely"}) {
    nodes.push_back(StationNode{id, 0.0, 0.0, {GtfsStopId{id}}});
  }
  std::vector<Edge> edges;
  for (const char* spoke : {"North", "East", "South"}) {
    edges.push_back(
        Edge{"Hub", spoke, {GtfsRouteId{"R"}}, {3}, {60}, std::nullopt}
    );
  }
  return TransitGraph(std::move(nodes), std::move(edges));
}

}  // namespace

TEST(GraphStatsTest, EmptyGraph) {
  GraphStats stats = ComputeGraphStats(TransitGraph());

  EXPECT_EQ(stats.num_nodes, 0);
  EXPECT_EQ(stats.num_edges, 0);
  EXPECT_EQ(stats.min_degree, 0);
  EXPECT_EQ(stats.max_degree, 0);
  EXPECT_EQ(stats.avg_degree, 0.0);
  EXPECT_THAT(stats.degrees, IsEmpty());
}

TEST(GraphStatsTest, StarGraph) {
  GraphStats stats = ComputeGraphStats(MakeStar());

  EXPECT_EQ(stats.num_nodes, 5);
  EXPECT_EQ(stats.num_edges, 3);
  EXPECT_EQ(stats.min_degree, 0);
  EXPECT_EQ(stats.max_degree, 3);
  EXPECT_THAT(stats.avg_degree, DoubleEq(6.0 / 5.0));
  EXPECT_THAT(
      stats.degrees,
      UnorderedElementsAre(
          Pair("Hub", 3),
          Pair("North", 1),
          Pair("East", 1),
          Pair("South", 1),
          Pair("Lonely", 0)
      )
  );
}

TEST(GraphStatsTest, SummarizePathCosts) {
  AllPairsResult result;
  result.paths[NodePair{"A", "B"}] = WeightedPath{{"A", "B"}, 2.0};
  result.paths[NodePair{"A", "C"}] = WeightedPath{{"A", "B", "C"}, 6.0};
  result.paths[NodePair{"B", "C"}] = WeightedPath{{"B", "C"}, 4.0};
  result.paths[NodePair{"A", "D"}] = WeightedPath{};

  PathCostSummary summary = SummarizePathCosts(result);

  EXPECT_EQ(summary.count, 3);
  EXPECT_EQ(summary.min_cost, 2.0);
  EXPECT_EQ(summary.max_cost, 6.0);
  EXPECT_EQ(summary.mean_cost, 4.0);
}

TEST(GraphStatsTest, SummarizeNoPaths) {
  PathCostSummary summary = SummarizePathCosts(AllPairsResult{});

  EXPECT_EQ(summary.count, 0);
  EXPECT_EQ(summary.mean_cost, 0.0);
}
