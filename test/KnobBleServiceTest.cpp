#include <gtest/gtest.h>

#include <string.h>

#include <string>
#include <vector>

#include "ble/GattTable.hpp"
#include "ble/KnobBleService.hpp"
#include "fakes/FakeBle.hpp"
#include "hid/KeyQueue.hpp"
#include "input/KnobInput.hpp"

class KnobBleServiceTest : public ::testing::Test {
protected:
  void SetUp() override {
    table.build(GattTable::Identity{});
    callbacks.onSessionEnded = [this](SessionEnd end) { ended.push_back(end); };
    callbacks.onAdvertiseFailed = [this](HostError err) { failures.push_back(err); };
    callbacks.onKeySent = [this](KeyState key) { sent.push_back(key); };
  }

  // Starts advertising and hands the fake link to the service.
  void connect(uint32_t nowMs) {
    peripheral.connectLink = &link;
    service.tick(nowMs);
    ASSERT_EQ(service.state(), KnobBleService::State::InSession);
  }

  std::vector<std::vector<uint8_t>> inputReports() const {
    std::vector<std::vector<uint8_t>> out;
    for (const SentNotify& n : link.notifies) {
      if (n.handle == table.handle(AttrId::InputReport)) out.push_back(n.data);
    }
    return out;
  }

  GattTable        table;
  KeyQueue         keys;
  SessionCallbacks callbacks;
  FakePeripheral   peripheral;
  FakeLink         link;
  KnobBleService   service{peripheral, table, keys, callbacks};

  std::vector<SessionEnd> ended;
  std::vector<HostError>  failures;
  std::vector<KeyState>   sent;
};

TEST_F(KnobBleServiceTest, AdvertisesNameAndServices) {
  service.begin("Simple Volume Knob", 0);
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
  EXPECT_EQ(peripheral.starts, 1);

  const std::vector<uint8_t>& advData = peripheral.lastAdv;
  const std::string blob(advData.begin(), advData.end());
  EXPECT_NE(blob.find("Simple Volume Knob"), std::string::npos);
  ASSERT_GE(advData.size(), 4u);
  // HID first, then Battery
  EXPECT_EQ(advData[advData.size() - 4], 0x12);
  EXPECT_EQ(advData[advData.size() - 3], 0x18);
  EXPECT_EQ(advData[advData.size() - 2], 0x0F);
  EXPECT_EQ(advData[advData.size() - 1], 0x18);
}

TEST_F(KnobBleServiceTest, EmptyNameFallsBackToDefault) {
  service.begin("", 0);
  EXPECT_STREQ(service.deviceName(), "Simple Volume Knob");
}

TEST_F(KnobBleServiceTest, FirstConnectionIsBondable) {
  service.begin("Knob", 0);
  connect(1);
  ASSERT_EQ(link.bondableCalls.size(), 1u);
  EXPECT_TRUE(link.bondableCalls[0]);
  EXPECT_TRUE(service.isConnected());
}

TEST_F(KnobBleServiceTest, QueuedKeyIsSentAsPressAndRelease) {
  service.setReleaseDelay(50);
  service.begin("Knob", 0);
  connect(1);

  ASSERT_TRUE(keys.push(KeyState::VolDown));
  service.tick(100);
  ASSERT_EQ(inputReports().size(), 1u);
  EXPECT_EQ(inputReports()[0], (std::vector<uint8_t>{kHidInputReportId, 0x02}));

  service.tick(149);
  EXPECT_EQ(inputReports().size(), 1u);
  service.tick(150);
  ASSERT_EQ(inputReports().size(), 2u);
  EXPECT_EQ(inputReports()[1], (std::vector<uint8_t>{kHidInputReportId, 0x00}));
  EXPECT_EQ(sent, (std::vector<KeyState>{KeyState::VolDown}));
}

TEST_F(KnobBleServiceTest, DisconnectMidReleaseStartsNewAdvertisingCycle) {
  service.setReleaseDelay(50);
  service.begin("Knob", 0);
  connect(1);

  ASSERT_TRUE(keys.push(KeyState::VolUp));
  service.tick(100);
  ASSERT_EQ(inputReports().size(), 1u);

  link.pushDisconnect(0x13);
  service.tick(120);

  EXPECT_EQ(ended, (std::vector<SessionEnd>{SessionEnd::Disconnected}));
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
  EXPECT_EQ(peripheral.starts, 2);

  // the cancelled release is never sent
  service.tick(200);
  EXPECT_EQ(inputReports().size(), 1u);
}

TEST_F(KnobBleServiceTest, NotifyFailureEndsSessionAndDisconnects) {
  service.begin("Knob", 0);
  connect(1);

  link.failNotify = true;
  ASSERT_TRUE(keys.push(KeyState::Mute));
  service.tick(10);

  EXPECT_EQ(ended, (std::vector<SessionEnd>{SessionEnd::NotifierStopped}));
  EXPECT_EQ(link.disconnects, 1);
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
}

TEST_F(KnobBleServiceTest, UnsubscribedReportsAreSkippedAndSessionContinues) {
  service.setReleaseDelay(50);
  service.begin("Knob", 0);
  link.gateOnSubscription = true;
  connect(1);

  ASSERT_TRUE(keys.push(KeyState::VolUp));
  service.tick(10);
  service.tick(60);
  EXPECT_TRUE(inputReports().empty());
  EXPECT_GE(link.skippedNotifies, 2);
  EXPECT_EQ(service.state(), KnobBleService::State::InSession);
  EXPECT_TRUE(ended.empty());
  EXPECT_EQ(link.disconnects, 0);

  ASSERT_TRUE(link.subscriptions.update(table.handle(AttrId::InputReport), true));
  ASSERT_TRUE(keys.push(KeyState::VolDown));
  service.tick(100);
  service.tick(150);
  const auto reports = inputReports();
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_EQ(reports[0], (std::vector<uint8_t>{kHidInputReportId, 0x02}));
  EXPECT_EQ(reports[1], (std::vector<uint8_t>{kHidInputReportId, 0x00}));
}

TEST_F(KnobBleServiceTest, SubscribedReportsWaitForAuthentication) {
  service.setReleaseDelay(50);
  service.begin("Knob", 0);
  link.gateOnSubscription = true;
  link.level = SecurityLevel::Encrypted;
  ASSERT_TRUE(link.subscriptions.update(table.handle(AttrId::InputReport), true));
  connect(1);

  ASSERT_TRUE(keys.push(KeyState::Mute));
  service.tick(10);
  service.tick(60);
  EXPECT_TRUE(inputReports().empty());
  EXPECT_EQ(service.state(), KnobBleService::State::InSession);

  link.level = SecurityLevel::EncryptedAuthenticated;
  ASSERT_TRUE(keys.push(KeyState::VolUp));
  service.tick(100);
  ASSERT_EQ(inputReports().size(), 1u);
}

TEST_F(KnobBleServiceTest, HeldBondMakesNextConnectionNonBondable) {
  service.begin("Knob", 0);
  connect(1);

  BondInformation bond;
  bond.addr[0] = 0xAA;
  link.pushPairing(SecurityLevel::EncryptedAuthenticated, &bond);
  link.pushDisconnect(0x13);
  service.tick(5);
  ASSERT_TRUE(service.bonds().hasBond());
  ASSERT_EQ(service.state(), KnobBleService::State::Advertising);

  FakeLink second;
  peripheral.connectLink = &second;
  service.tick(6);
  ASSERT_EQ(second.bondableCalls.size(), 1u);
  EXPECT_FALSE(second.bondableCalls[0]);

  service.forgetBond();
  EXPECT_FALSE(service.bonds().hasBond());
  second.pushDisconnect(0x13);
  service.tick(7);
}

TEST_F(KnobBleServiceTest, UnauthenticatedAccessInSessionIsRejected) {
  service.begin("Knob", 0);
  connect(1);
  link.level = SecurityLevel::Encrypted;
  link.pushGatt(GattOp::Read, table.handle(AttrId::BatteryLevel), 77);
  service.tick(2);
  ASSERT_EQ(link.replies.size(), 1u);
  EXPECT_EQ(link.replies[0].code, AttError::InsufficientAuthentication);
}

TEST_F(KnobBleServiceTest, AdvertiseFailureRetriesAfterBackoff) {
  service.setRetryDelay(1000);
  peripheral.failStart = true;
  service.begin("Knob", 0);
  EXPECT_EQ(service.state(), KnobBleService::State::Backoff);
  EXPECT_EQ(failures, (std::vector<HostError>{HostError::AdvertisingStart}));

  service.tick(999);
  EXPECT_EQ(peripheral.starts, 1);

  peripheral.failStart = false;
  service.tick(1000);
  EXPECT_EQ(peripheral.starts, 2);
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
}

TEST_F(KnobBleServiceTest, AcceptFailureBacksOff) {
  service.setRetryDelay(500);
  service.begin("Knob", 0);
  peripheral.failAccept = true;
  service.tick(10);
  EXPECT_EQ(service.state(), KnobBleService::State::Backoff);
  EXPECT_EQ(failures, (std::vector<HostError>{HostError::Accept}));
  service.tick(510);
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
}

TEST_F(KnobBleServiceTest, UnusableLinkGoesStraightBackToAdvertising) {
  service.begin("Knob", 0);
  link.bondableOk = false;
  peripheral.connectLink = &link;
  service.tick(1);
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
  EXPECT_EQ(peripheral.starts, 2);
  EXPECT_EQ(link.disconnects, 1);
}

TEST_F(KnobBleServiceTest, DemoModeAlternatesVolume) {
  service.setReleaseDelay(50);
  service.setDemoMode(true);
  service.begin("Knob", 0);
  connect(0);

  for (uint32_t t = 0; t <= 4200; t += 10) service.tick(t);
  ASSERT_GE(sent.size(), 2u);
  EXPECT_EQ(sent[0], KeyState::VolUp);
  EXPECT_EQ(sent[1], KeyState::VolDown);
}

TEST_F(KnobBleServiceTest, OneLeftDetentProducesOneVolDownCycle) {
  FakeKnobHal hal;
  KnobInput input(hal, keys);
  KnobInput::Config cfg;
  cfg.debounceUs = 1000;

  service.setReleaseDelay(50);
  service.begin("Knob", 0);
  connect(1);
  input.begin(cfg);

  uint32_t ms = 10;
  auto step = [&]() {
    hal.us += 600;
    input.poll();
    service.tick(ms++);
  };
  hal.a = false;
  for (int i = 0; i < 3; ++i) step();
  hal.b = false;
  for (int i = 0; i < 3; ++i) step();
  for (int i = 0; i < 60; ++i) step();

  const auto reports = inputReports();
  ASSERT_EQ(reports.size(), 2u);
  EXPECT_EQ(reports[0], (std::vector<uint8_t>{kHidInputReportId, 0x02}));
  EXPECT_EQ(reports[1], (std::vector<uint8_t>{kHidInputReportId, 0x00}));
  EXPECT_EQ(sent, (std::vector<KeyState>{KeyState::VolDown}));
}

TEST_F(KnobBleServiceTest, ForgetAndRestartDropsBondedSession) {
  service.begin("Knob", 0);
  connect(1);
  BondInformation bond;
  bond.addr[0] = 0x42;
  link.pushPairing(SecurityLevel::EncryptedAuthenticated, &bond);
  service.tick(2);
  ASSERT_TRUE(service.bonds().hasBond());

  service.forgetBond();
  service.restart(3);

  EXPECT_EQ(ended, (std::vector<SessionEnd>{SessionEnd::Aborted}));
  EXPECT_EQ(link.disconnects, 1);
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
  EXPECT_EQ(peripheral.starts, 2);

  // the same central comes back and may pair again
  link.open = true;
  peripheral.connectLink = &link;
  service.tick(4);
  ASSERT_EQ(link.bondableCalls.size(), 2u);
  EXPECT_TRUE(link.bondableCalls[1]);
}

TEST_F(KnobBleServiceTest, RestartWhileAdvertisingStartsFreshWindow) {
  service.begin("Knob", 0);
  service.restart(5);
  EXPECT_EQ(peripheral.stops, 1);
  EXPECT_EQ(peripheral.starts, 2);
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
  EXPECT_TRUE(ended.empty());
}

TEST_F(KnobBleServiceTest, ClosingLinkIsRetriedAfterBackoff) {
  service.setRetryDelay(200);
  service.begin("Knob", 0);
  connect(1);

  peripheral.failStart  = true;
  peripheral.startError = HostError::Disconnect;
  link.pushDisconnect(0x13);
  service.tick(2);
  EXPECT_EQ(service.state(), KnobBleService::State::Backoff);
  ASSERT_EQ(failures, (std::vector<HostError>{HostError::Disconnect}));
  EXPECT_TRUE(hostErrorIsTransient(failures[0]));

  peripheral.failStart = false;
  service.tick(202);
  EXPECT_EQ(service.state(), KnobBleService::State::Advertising);
}
