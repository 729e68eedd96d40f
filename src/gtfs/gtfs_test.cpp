#include "gtfs/gtfs.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>

using namespace transitgraph;
using ::testing::AllOf;
using ::testing::Contains;
using ::testing::DoubleNear;
using ::testing::Eq;
using ::testing::Field;
using ::testing::HasSubstr;

namespace {

const std::string kTestdataDir = TRANSITGRAPH_TESTDATA_DIR;

}  // namespace

TEST(GtfsTest, ParseGtfsTimeBasic) {
  EXPECT_EQ(ParseGtfsTime("08:04:30").seconds, 8 * 3600 + 4 * 60 + 30);
  EXPECT_EQ(ParseGtfsTime("0:00:00").seconds, 0);
  EXPECT_EQ(ParseGtfsTime("7:05:00").seconds, 7 * 3600 + 5 * 60);
}

TEST(GtfsTest, ParseGtfsTimePastMidnight) {
  EXPECT_EQ(ParseGtfsTime("25:10:00").seconds, 90600);
  EXPECT_EQ(ParseGtfsTime("24:02:00").seconds, 86520);
}

TEST(GtfsTest, ParseGtfsTimeMalformedIsZero) {
  EXPECT_EQ(ParseGtfsTime("").seconds, 0);
  EXPECT_EQ(ParseGtfsTime("08:00").seconds, 0);
  EXPECT_EQ(ParseGtfsTime("08:00:00:00").seconds, 0);
  EXPECT_EQ(ParseGtfsTime("ab:cd:ef").seconds, 0);
  EXPECT_EQ(ParseGtfsTime("08::00").seconds, 0);
  EXPECT_EQ(ParseGtfsTime("-1:00:00").seconds, 0);
  EXPECT_EQ(ParseGtfsTime("600000:00:00").seconds, 0);
  EXPECT_EQ(ParseGtfsTime("596523:14:08").seconds, 0);
}

TEST(GtfsTest, ParseGtfsTimeLargestRepresentable) {
  // INT_MAX seconds is 596523:14:07.
  EXPECT_EQ(ParseGtfsTime("596523:14:07").seconds, 2147483647);
}

TEST(GtfsTest, GtfsLoadFixture) {
  Gtfs gtfs = GtfsLoad(kTestdataDir + "/mini");

  EXPECT_EQ(gtfs.stops.size(), 6);
  EXPECT_THAT(
      gtfs.stops,
      Contains(AllOf(
          Field(&GtfsStop::stop_id, Field(&GtfsStopId::v, Eq("B2"))),
          Field(&GtfsStop::stop_name, Eq("  Beta  ")),
          Field(&GtfsStop::stop_lat, DoubleNear(53.53, 1e-9)),
          Field(&GtfsStop::stop_lon, DoubleNear(10.0, 1e-9))
      ))
  );

  EXPECT_EQ(gtfs.routes.size(), 3);
  EXPECT_THAT(
      gtfs.routes,
      Contains(AllOf(
          Field(&GtfsRoute::route_id, Field(&GtfsRouteId::v, Eq("N5"))),
          Field(&GtfsRoute::route_type, Eq(402)),
          Field(&GtfsRoute::route_short_name, Eq("")),
          Field(&GtfsRoute::route_long_name, Eq("Night Express"))
      ))
  );

  EXPECT_EQ(gtfs.trips.size(), 4);
  EXPECT_THAT(
      gtfs.trips,
      Contains(GtfsTrip{GtfsTripId{"t4"}, GtfsRouteId{"B7"}})
  );

  EXPECT_EQ(gtfs.stop_times.size(), 10);
  EXPECT_THAT(
      gtfs.stop_times,
      Contains(GtfsStopTime{
          GtfsTripId{"t1"},
          GtfsStopId{"B1"},
          2,
          ParseGtfsTime("08:04:00"),
          ParseGtfsTime("08:05:00")
      })
  );
}

TEST(GtfsTest, GtfsLoadMissingDirectoryThrowsSchemaError) {
  try {
    GtfsLoad(kTestdataDir + "/does_not_exist");
    FAIL() << "Expected GtfsSchemaError";
  } catch (const GtfsSchemaError& e) {
    EXPECT_THAT(e.what(), HasSubstr("stops.txt"));
  }
}

TEST(GtfsTest, GtfsLoadMissingColumnThrowsSchemaError) {
  try {
    GtfsLoad(kTestdataDir + "/bad_schema");
    FAIL() << "Expected GtfsSchemaError";
  } catch (const GtfsSchemaError& e) {
    EXPECT_THAT(e.what(), HasSubstr("stop_lat"));
  }
}

TEST(GtfsTest, RouteDisplayName) {
  GtfsRoute route{GtfsRouteId{"R1"}, 402, "U3", "Ring line", ""};
  EXPECT_EQ(RouteDisplayName(route), "U3");

  route.route_short_name = "";
  EXPECT_EQ(RouteDisplayName(route), "Ring line");

  route.route_long_name = "A very long route name that goes on and on";
  EXPECT_EQ(RouteDisplayName(route), "A very long route name that go");

  route.route_long_name = "";
  EXPECT_EQ(RouteDisplayName(route), "R1");
}

TEST(GtfsTest, RouteColorHex) {
  GtfsRoute route{GtfsRouteId{"R1"}, 402, "U3", "", "FFDD00"};
  EXPECT_EQ(RouteColorHex(route), "#FFDD00");

  route.route_color = "0a0";
  EXPECT_EQ(RouteColorHex(route), "#0a0");

  route.route_color = "";
  EXPECT_EQ(RouteColorHex(route), "#999999");

  route.route_color = "ZZZ";
  EXPECT_EQ(RouteColorHex(route, "#000000"), "#000000");

  route.route_color = "12345";
  EXPECT_EQ(RouteColorHex(route), "#999999");
}
