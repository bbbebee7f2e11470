#include <gtest/gtest.h>

#include "input/Debouncer.hpp"

TEST(Debouncer, AcceptsLevelAfterStableTime) {
  Debouncer d;
  d.begin(true, 1000, 0);
  EXPECT_FALSE(d.update(false, 100));
  EXPECT_FALSE(d.update(false, 1000));
  EXPECT_TRUE(d.level());
  EXPECT_TRUE(d.update(false, 1100));
  EXPECT_FALSE(d.level());
  // no second report for the same level
  EXPECT_FALSE(d.update(false, 5000));
}

TEST(Debouncer, ToggleRestartsWindow) {
  Debouncer d;
  d.begin(true, 1000, 0);
  EXPECT_FALSE(d.update(false, 100));
  EXPECT_FALSE(d.update(true, 600));
  EXPECT_FALSE(d.update(false, 900));
  EXPECT_FALSE(d.update(false, 1800));
  EXPECT_TRUE(d.update(false, 1900));
}

TEST(Debouncer, GlitchShorterThanWindowIsIgnored) {
  Debouncer d;
  d.begin(true, 1000, 0);
  EXPECT_FALSE(d.update(false, 100));
  EXPECT_FALSE(d.update(true, 400));
  EXPECT_FALSE(d.update(true, 5000));
  EXPECT_TRUE(d.level());
}

TEST(Debouncer, HandlesMicrosWraparound) {
  Debouncer d;
  d.begin(false, 1000, 0xFFFFFE00u);
  EXPECT_FALSE(d.update(true, 0xFFFFFF00u));
  EXPECT_TRUE(d.update(true, 0x00000300u));
  EXPECT_TRUE(d.level());
}
