#include "util/format.h"

#include <gtest/gtest.h>

using namespace transitgraph;

TEST(FormatTest, FormatTravelTime) {
  EXPECT_EQ(FormatTravelTime(0), "0.0 sec");
  EXPECT_EQ(FormatTravelTime(12.5), "12.5 sec");
  EXPECT_EQ(FormatTravelTime(60), "1.0 min");
  EXPECT_EQ(FormatTravelTime(240), "4.0 min");
  EXPECT_EQ(FormatTravelTime(3599), "60.0 min");
  EXPECT_EQ(FormatTravelTime(3600), "1 h 0 min");
  EXPECT_EQ(FormatTravelTime(3900), "1 h 5 min");
  EXPECT_EQ(FormatTravelTime(2 * 3600 + 59 * 60 + 59), "2 h 59 min");
}

TEST(FormatTest, FormatDistance) {
  EXPECT_EQ(FormatDistance(0), "0 m");
  EXPECT_EQ(FormatDistance(0.85), "850 m");
  EXPECT_EQ(FormatDistance(1), "1.00 km");
  EXPECT_EQ(FormatDistance(3.254), "3.25 km");
  EXPECT_EQ(FormatDistance(111.19492664), "111.19 km");
}
