#include <gtest/gtest.h>

#include "ble/SubscriptionTracker.hpp"

TEST(SubscriptionTracker, NothingSubscribedInitially) {
  SubscriptionTracker subs;
  EXPECT_FALSE(subs.subscribed(8));
  EXPECT_EQ(subs.count(), 0u);
}

TEST(SubscriptionTracker, FollowsCccdWrites) {
  SubscriptionTracker subs;
  ASSERT_TRUE(subs.update(8, true));
  ASSERT_TRUE(subs.update(3, true));
  EXPECT_TRUE(subs.subscribed(8));
  EXPECT_TRUE(subs.subscribed(3));
  EXPECT_FALSE(subs.subscribed(5));

  ASSERT_TRUE(subs.update(8, false));
  EXPECT_FALSE(subs.subscribed(8));
  EXPECT_EQ(subs.count(), 1u);
}

TEST(SubscriptionTracker, ClearDropsEverything) {
  SubscriptionTracker subs;
  subs.update(8, true);
  subs.update(3, true);
  subs.clear();
  EXPECT_FALSE(subs.subscribed(8));
  EXPECT_FALSE(subs.subscribed(3));
  EXPECT_EQ(subs.count(), 0u);
}

TEST(SubscriptionTracker, FullTableRejectsNewHandle) {
  SubscriptionTracker subs;
  for (uint16_t h = 1; h <= SubscriptionTracker::kMaxHandles; ++h) {
    ASSERT_TRUE(subs.update(h, true));
  }
  EXPECT_FALSE(subs.update(100, true));
  EXPECT_FALSE(subs.subscribed(100));
  // unsubscribing an unknown handle needs no slot
  EXPECT_TRUE(subs.update(100, false));
  // known handles still update
  EXPECT_TRUE(subs.update(1, false));
  EXPECT_FALSE(subs.subscribed(1));
}

TEST(SubscriptionTracker, HandleZeroIsNeverTracked) {
  SubscriptionTracker subs;
  EXPECT_FALSE(subs.update(0, true));
  EXPECT_FALSE(subs.subscribed(0));
}
