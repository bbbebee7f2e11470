#include <gtest/gtest.h>

#include <string.h>

#include "ble/AdvertisingController.hpp"
#include "ble/AdvertisingPayload.hpp"
#include "fakes/FakeBle.hpp"

namespace {
const uint16_t kServices[] = {0x1812, 0x180F};
}

TEST(AdvertisingPayload, EncodesFlagsNameAndServices) {
  AdvertisingPayload p;
  ASSERT_TRUE(encodeAdvertisingPayload("Simple Volume Knob", kServices, 2, p));

  const size_t nameLen = strlen("Simple Volume Knob");
  ASSERT_EQ(p.len, 3 + (2 + nameLen) + 6);
  EXPECT_LE(p.len, adv::kMaxLen);

  EXPECT_EQ(p.bytes[0], 0x02);
  EXPECT_EQ(p.bytes[1], adv::kTypeFlags);
  EXPECT_EQ(p.bytes[2], 0x06);

  EXPECT_EQ(p.bytes[3], nameLen + 1);
  EXPECT_EQ(p.bytes[4], adv::kTypeCompleteName);
  EXPECT_EQ(memcmp(&p.bytes[5], "Simple Volume Knob", nameLen), 0);

  const size_t u = 5 + nameLen;
  EXPECT_EQ(p.bytes[u], 0x05);
  EXPECT_EQ(p.bytes[u + 1], adv::kTypeComplete16);
  EXPECT_EQ(p.bytes[u + 2], 0x12);
  EXPECT_EQ(p.bytes[u + 3], 0x18);
  EXPECT_EQ(p.bytes[u + 4], 0x0F);
  EXPECT_EQ(p.bytes[u + 5], 0x18);
}

TEST(AdvertisingPayload, OverflowIsRejected) {
  AdvertisingPayload p;
  // 3 + 2 + 21 + 6 = 32 > 31
  EXPECT_FALSE(encodeAdvertisingPayload("ABCDEFGHIJKLMNOPQRSTU", kServices, 2, p));
  EXPECT_EQ(p.len, 0u);
  // 20 characters still fit
  EXPECT_TRUE(encodeAdvertisingPayload("ABCDEFGHIJKLMNOPQRST", kServices, 2, p));
  EXPECT_EQ(p.len, adv::kMaxLen);
}

TEST(AdvertisingPayload, NameIsOptional) {
  AdvertisingPayload p;
  ASSERT_TRUE(encodeAdvertisingPayload(nullptr, kServices, 2, p));
  EXPECT_EQ(p.len, 3u + 6u);
}

TEST(AdvertisingController, ReportsConnectedLink) {
  FakePeripheral peripheral;
  FakeLink link;
  AdvertisingController ctl(peripheral);

  ASSERT_TRUE(ctl.start("Knob", kServices, 2));
  EXPECT_EQ(peripheral.starts, 1);
  EXPECT_EQ(peripheral.lastAdv.size(), ctl.payload().len);
  EXPECT_EQ(ctl.tick(), AdvertisingController::State::Advertising);

  peripheral.connectLink = &link;
  EXPECT_EQ(ctl.tick(), AdvertisingController::State::Connected);
  EXPECT_EQ(ctl.link(), &link);
}

TEST(AdvertisingController, StartFailureCarriesHostError) {
  FakePeripheral peripheral;
  peripheral.failStart  = true;
  peripheral.startError = HostError::AdvertisingData;
  AdvertisingController ctl(peripheral);

  EXPECT_FALSE(ctl.start("Knob", kServices, 2));
  EXPECT_EQ(ctl.state(), AdvertisingController::State::Failed);
  EXPECT_EQ(ctl.error(), HostError::AdvertisingData);
}

TEST(AdvertisingController, OversizedNameNeverReachesHost) {
  FakePeripheral peripheral;
  AdvertisingController ctl(peripheral);
  EXPECT_FALSE(ctl.start("A name far too long for one advertisement", kServices, 2));
  EXPECT_EQ(ctl.error(), HostError::AdvertisingData);
  EXPECT_EQ(peripheral.starts, 0);
}

TEST(AdvertisingController, AcceptFailure) {
  FakePeripheral peripheral;
  AdvertisingController ctl(peripheral);
  ASSERT_TRUE(ctl.start("Knob", kServices, 2));
  peripheral.failAccept = true;
  EXPECT_EQ(ctl.tick(), AdvertisingController::State::Failed);
  EXPECT_EQ(ctl.error(), HostError::Accept);

  ASSERT_TRUE(ctl.start("Knob", kServices, 2));
  ctl.stop();
  EXPECT_EQ(peripheral.stops, 1);
  EXPECT_EQ(ctl.state(), AdvertisingController::State::Idle);
}

TEST(HostError, OnlyClosingLinkIsTransient) {
  EXPECT_TRUE(hostErrorIsTransient(HostError::Disconnect));
  EXPECT_FALSE(hostErrorIsTransient(HostError::None));
  EXPECT_FALSE(hostErrorIsTransient(HostError::AdvertisingData));
  EXPECT_FALSE(hostErrorIsTransient(HostError::AdvertisingStart));
  EXPECT_FALSE(hostErrorIsTransient(HostError::Accept));
  EXPECT_FALSE(hostErrorIsTransient(HostError::HostReset));
}
