#include <gtest/gtest.h>

#include "power/BatteryGauge.hpp"

TEST(BatteryGauge, LinearConversionClamps) {
  EXPECT_EQ(batteryPercentFromMv(0), 0);
  EXPECT_EQ(batteryPercentFromMv(3300), 0);
  EXPECT_EQ(batteryPercentFromMv(3750), 50);
  EXPECT_EQ(batteryPercentFromMv(4200), 100);
  EXPECT_EQ(batteryPercentFromMv(5000), 100);
}

TEST(BatteryGauge, DegenerateRangeReadsEmpty) {
  EXPECT_EQ(batteryPercentFromMv(4000, 4200, 4200), 0);
}

TEST(BatteryGauge, FirstSampleSeedsThenSmooths) {
  BatteryGauge g;
  EXPECT_EQ(g.update(4200), 100);
  const uint8_t dipped = g.update(3300);
  EXPECT_LT(dipped, 100);
  EXPECT_GT(dipped, 80);
  EXPECT_EQ(g.percent(), dipped);
}
