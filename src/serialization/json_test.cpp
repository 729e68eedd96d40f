#include "serialization/json.h"

#include <gtest/gtest.h>

#include <limits>

using namespace transitgraph;

namespace {

TransitGraph MakeGraph() {
  return TransitGraph(
      {StationNode{"Alpha", 53.5, 10.0, {GtfsStopId{"A1"}}},
       StationNode{"Beta", 53.52, 10.0, {GtfsStopId{"B1"}, GtfsStopId{"B2"}}}},
      {Edge{
          "Beta",
          "Alpha",
          {GtfsRouteId{"U1"}},
          {402},
          {240, 180},
          180.0,
      }}
  );
}

}  // namespace

TEST(JsonTest, Graph) {
  nlohmann::json j = MakeGraph();

  ASSERT_EQ(j["nodes"].size(), 2);
  EXPECT_EQ(j["nodes"][0]["id"], "Alpha");
  EXPECT_EQ(j["nodes"][0]["transfer"], false);
  EXPECT_EQ(j["nodes"][1]["stop_ids"], nlohmann::json::array({"B1", "B2"}));
  EXPECT_EQ(j["nodes"][1]["transfer"], true);

  ASSERT_EQ(j["edges"].size(), 1);
  const nlohmann::json& edge = j["edges"][0];
  EXPECT_EQ(edge["u"], "Beta");
  EXPECT_EQ(edge["v"], "Alpha");
  EXPECT_EQ(edge["route_ids"], nlohmann::json::array({"U1"}));
  EXPECT_EQ(edge["route_types"], nlohmann::json::array({402}));
  EXPECT_EQ(edge["travel_times"], nlohmann::json::array({240, 180}));
  EXPECT_EQ(edge["weight"], 180.0);
}

TEST(JsonTest, UnweightedEdgeIsNull) {
  TransitGraph graph(
      {StationNode{"A", 0, 0, {}}, StationNode{"B", 0, 0, {}}},
      {Edge{"A", "B", {}, {}, {}, std::nullopt}}
  );
  nlohmann::json j = graph;
  EXPECT_TRUE(j["edges"][0]["weight"].is_null());
}

TEST(JsonTest, InfiniteCostIsNull) {
  nlohmann::json missing = WeightedPath{};
  EXPECT_TRUE(missing["cost"].is_null());
  EXPECT_TRUE(missing["nodes"].empty());

  nlohmann::json found = WeightedPath{{"A", "B"}, 2.5};
  EXPECT_EQ(found["cost"], 2.5);
  EXPECT_EQ(found["nodes"], nlohmann::json::array({"A", "B"}));
}

TEST(JsonTest, AllPairsResult) {
  AllPairsResult result;
  result.paths[NodePair{"A", "B"}] = WeightedPath{{"A", "B"}, 1.0};
  result.paths[NodePair{"A", "C"}] = WeightedPath{{"A", "B", "C"}, 3.0};
  result.complete = false;
  result.pairs_processed = 2;

  nlohmann::json j = result;

  EXPECT_EQ(j["complete"], false);
  EXPECT_EQ(j["pairs_processed"], 2);
  ASSERT_EQ(j["paths"].size(), 2);
  EXPECT_EQ(j["paths"][1]["from"], "A");
  EXPECT_EQ(j["paths"][1]["to"], "C");
  EXPECT_EQ(j["paths"][1]["cost"], 3.0);
}

TEST(JsonTest, StatsAndSegments) {
  GraphStats stats = ComputeGraphStats(MakeGraph());
  nlohmann::json j = stats;
  EXPECT_EQ(j["num_nodes"], 2);
  EXPECT_EQ(j["degrees"]["Alpha"], 1);
  EXPECT_EQ(j["avg_degree"], 1.0);

  nlohmann::json segment = RouteSegment{"Alpha", "Beta", {"U1"}};
  EXPECT_EQ(segment["route_names"], nlohmann::json::array({"U1"}));
}

TEST(JsonTest, StopIdRoundTrip) {
  nlohmann::json j = GtfsStopId{"B2"};
  EXPECT_EQ(j, "B2");
  EXPECT_EQ(j.get<GtfsStopId>(), GtfsStopId{"B2"});
}

TEST(JsonTest, PathComparison) {
  nlohmann::json j =
      ComparePaths(NodePath{"A", "C", "B", "D"}, NodePath{"A", "B", "D"});
  EXPECT_EQ(j["first_length"], 4);
  EXPECT_EQ(j["second_edges"], 2);
  EXPECT_EQ(j["length_difference"], 1);
  EXPECT_EQ(j["same_path"], false);

  nlohmann::json missing = ComparePaths(std::nullopt, NodePath{"A"});
  EXPECT_TRUE(missing["first_length"].is_null());
  EXPECT_TRUE(missing["length_difference"].is_null());
  EXPECT_EQ(missing["second_length"], 1);
}
