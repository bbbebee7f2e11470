#include <gtest/gtest.h>

#include "ble/GattTable.hpp"
#include "ble/StatusNotifier.hpp"
#include "fakes/FakeBle.hpp"

class StatusNotifierTest : public ::testing::Test {
protected:
  void SetUp() override {
    table.build(GattTable::Identity{});
    status.begin(link, 0);
  }

  GattTable      table;
  FakeLink       link;
  StatusNotifier status{table, 1000};
};

TEST_F(StatusNotifierTest, QuietUntilIntervalElapses) {
  EXPECT_TRUE(status.tick(10));
  EXPECT_TRUE(status.tick(999));
  EXPECT_TRUE(link.notifies.empty());

  EXPECT_TRUE(status.tick(1000));
  EXPECT_EQ(link.notifiesOn(table.handle(AttrId::BatteryLevel)), 1u);
  EXPECT_EQ(link.notifiesOn(table.handle(AttrId::Status)), 1u);

  EXPECT_TRUE(status.tick(1500));
  EXPECT_EQ(link.notifies.size(), 2u);
  EXPECT_TRUE(status.tick(2000));
  EXPECT_EQ(link.notifies.size(), 4u);
}

TEST_F(StatusNotifierTest, BatteryChangeIsPushedImmediately) {
  table.setByte(AttrId::BatteryLevel, 80);
  EXPECT_TRUE(status.tick(5));
  ASSERT_EQ(link.notifies.size(), 1u);
  EXPECT_EQ(link.notifies[0].handle, table.handle(AttrId::BatteryLevel));
  EXPECT_EQ(link.notifies[0].data, (std::vector<uint8_t>{80}));

  // same value: no repeat
  EXPECT_TRUE(status.tick(6));
  EXPECT_EQ(link.notifies.size(), 1u);
}

TEST_F(StatusNotifierTest, StatusWriteIsEchoed) {
  const uint8_t on = 1;
  ASSERT_EQ(table.write(table.handle(AttrId::Status), &on, 1), AttError::None);
  EXPECT_TRUE(status.tick(5));
  ASSERT_EQ(link.notifies.size(), 1u);
  EXPECT_EQ(link.notifies[0].handle, table.handle(AttrId::Status));
}

TEST_F(StatusNotifierTest, DeliveryFailureIsReported) {
  link.open = false;
  EXPECT_FALSE(status.tick(1000));
  EXPECT_EQ(status.failedHandle(), table.handle(AttrId::BatteryLevel));
}

TEST_F(StatusNotifierTest, CancelledNotifierDoesNothing) {
  status.cancel();
  link.open = false;
  EXPECT_TRUE(status.tick(5000));
  EXPECT_TRUE(link.notifies.empty());
}
