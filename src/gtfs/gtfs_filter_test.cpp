#include "gtfs/gtfs_filter.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

using namespace transitgraph;
using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::UnorderedElementsAre;

// Helper to build a minimal Gtfs for synthetic tests.
static Gtfs MakeSyntheticGtfs() {
  Gtfs gtfs;

  // A subway route and a bus route
  gtfs.routes = {
      GtfsRoute{GtfsRouteId{"U1"}, 402, "U1", "", ""},
      GtfsRoute{GtfsRouteId{"B7"}, 3, "7", "", ""},
  };

  gtfs.stops = {
      GtfsStop{GtfsStopId{"S1"}, "Stop 1", 53.0, 10.0},
      GtfsStop{GtfsStopId{"S2"}, "Stop 2", 53.1, 10.1},
      GtfsStop{GtfsStopId{"S3"}, "Stop 3", 53.2, 10.2},
  };

  gtfs.trips = {
      GtfsTrip{GtfsTripId{"T1"}, GtfsRouteId{"U1"}},
      GtfsTrip{GtfsTripId{"T2"}, GtfsRouteId{"B7"}},
  };

  gtfs.stop_times = {
      GtfsStopTime{GtfsTripId{"T1"}, GtfsStopId{"S1"}, 1, {0}, {0}},
      GtfsStopTime{GtfsTripId{"T1"}, GtfsStopId{"S2"}, 2, {60}, {60}},
      GtfsStopTime{GtfsTripId{"T2"}, GtfsStopId{"S2"}, 1, {0}, {0}},
      GtfsStopTime{GtfsTripId{"T2"}, GtfsStopId{"S3"}, 2, {90}, {90}},
  };

  return gtfs;
}

TEST(GtfsFilterTest, NoFilterKeepsEverything) {
  Gtfs gtfs = MakeSyntheticGtfs();
  Gtfs result = GtfsFilterByRouteTypes(gtfs, std::nullopt);

  EXPECT_EQ(result.routes, gtfs.routes);
  EXPECT_EQ(result.trips, gtfs.trips);
  EXPECT_EQ(result.stop_times, gtfs.stop_times);
  EXPECT_EQ(result.stops, gtfs.stops);
}

TEST(GtfsFilterTest, FilterByRouteTypeCascades) {
  Gtfs gtfs = MakeSyntheticGtfs();
  Gtfs result = GtfsFilterByRouteTypes(gtfs, std::unordered_set<int>{402});

  EXPECT_THAT(
      result.routes,
      ElementsAre(Field(&GtfsRoute::route_id, GtfsRouteId{"U1"}))
  );
  EXPECT_THAT(
      result.trips, ElementsAre(Field(&GtfsTrip::trip_id, GtfsTripId{"T1"}))
  );
  EXPECT_THAT(
      result.stop_times,
      ElementsAre(
          Field(&GtfsStopTime::stop_id, GtfsStopId{"S1"}),
          Field(&GtfsStopTime::stop_id, GtfsStopId{"S2"})
      )
  );

  // Stops are left to the clusterer
  EXPECT_EQ(result.stops.size(), 3);
}

TEST(GtfsFilterTest, EmptyFilterKeepsNoRoutes) {
  Gtfs gtfs = MakeSyntheticGtfs();
  Gtfs result = GtfsFilterByRouteTypes(gtfs, std::unordered_set<int>{});

  EXPECT_TRUE(result.routes.empty());
  EXPECT_TRUE(result.trips.empty());
  EXPECT_TRUE(result.stop_times.empty());
}

TEST(GtfsFilterTest, UsedStopIds) {
  Gtfs gtfs = MakeSyntheticGtfs();

  EXPECT_THAT(
      UsedStopIds(gtfs.stop_times),
      UnorderedElementsAre(GtfsStopId{"S1"}, GtfsStopId{"S2"}, GtfsStopId{"S3"})
  );

  Gtfs subway = GtfsFilterByRouteTypes(gtfs, std::unordered_set<int>{402});
  EXPECT_THAT(
      UsedStopIds(subway.stop_times),
      UnorderedElementsAre(GtfsStopId{"S1"}, GtfsStopId{"S2"})
  );
}
