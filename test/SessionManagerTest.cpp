#include <gtest/gtest.h>

#include <vector>

#include "ble/BondTracker.hpp"
#include "ble/SessionManager.hpp"
#include "fakes/FakeBle.hpp"

namespace {

class ScriptedTask : public SessionTask {
public:
  void begin(BleLink& link, uint32_t nowMs) override {
    (void)nowMs;
    linked = &link;
    ++begins;
  }
  bool tick(uint32_t nowMs) override {
    ++ticks;
    return doneAtMs >= 0 && nowMs >= (uint32_t)doneAtMs;
  }
  void cancel() override { ++cancels; }

  BleLink* linked  = nullptr;
  int      begins  = 0;
  int      ticks   = 0;
  int      cancels = 0;
  int64_t  doneAtMs = -1;
};

}  // namespace

class SessionManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    callbacks.onSessionEnded = [this](SessionEnd end) { ended.push_back(end); };
  }

  FakeLink         link;
  BondTracker      bonds;
  SessionCallbacks callbacks;
  ScriptedTask     pump;
  ScriptedTask     notifier;
  SessionManager   session{pump, notifier, bonds, callbacks};
  std::vector<SessionEnd> ended;
};

TEST_F(SessionManagerTest, BondableOnlyWithoutExistingBond) {
  ASSERT_TRUE(session.begin(link, 0));
  session.abort();

  BondInformation b;
  b.addr[0] = 9;
  bonds.assign(&b);
  FakeLink second;
  ASSERT_TRUE(session.begin(second, 10));

  ASSERT_EQ(link.bondableCalls.size(), 1u);
  EXPECT_TRUE(link.bondableCalls[0]);
  ASSERT_EQ(second.bondableCalls.size(), 1u);
  EXPECT_FALSE(second.bondableCalls[0]);
  session.abort();
}

TEST_F(SessionManagerTest, BeginStartsBothTasksOnTheLink) {
  ASSERT_TRUE(session.begin(link, 0));
  EXPECT_TRUE(session.active());
  EXPECT_EQ(pump.linked, &link);
  EXPECT_EQ(notifier.linked, &link);
  EXPECT_EQ(session.tick(1), SessionEnd::None);
  EXPECT_EQ(pump.ticks, 1);
  EXPECT_EQ(notifier.ticks, 1);
}

TEST_F(SessionManagerTest, UnusableLinkIsDroppedBeforeTasksStart) {
  link.bondableOk = false;
  EXPECT_FALSE(session.begin(link, 0));
  EXPECT_FALSE(session.active());
  EXPECT_EQ(link.disconnects, 1);
  EXPECT_EQ(pump.begins, 0);
  EXPECT_EQ(notifier.begins, 0);
}

TEST_F(SessionManagerTest, PumpCompletionEndsSessionAndCancelsNotifier) {
  ASSERT_TRUE(session.begin(link, 0));
  pump.doneAtMs = 5;
  link.open = false;  // the peer went away

  EXPECT_EQ(session.tick(4), SessionEnd::None);
  EXPECT_EQ(session.tick(5), SessionEnd::Disconnected);
  EXPECT_FALSE(session.active());
  EXPECT_EQ(pump.cancels, 1);
  EXPECT_EQ(notifier.cancels, 1);
  EXPECT_EQ(link.disconnects, 0);
  EXPECT_EQ(ended, (std::vector<SessionEnd>{SessionEnd::Disconnected}));

  // nothing further runs
  const int ticks = notifier.ticks;
  EXPECT_EQ(session.tick(6), SessionEnd::None);
  EXPECT_EQ(notifier.ticks, ticks);
}

TEST_F(SessionManagerTest, NotifierCompletionDisconnectsOpenLink) {
  ASSERT_TRUE(session.begin(link, 0));
  notifier.doneAtMs = 3;
  EXPECT_EQ(session.tick(3), SessionEnd::NotifierStopped);
  EXPECT_EQ(link.disconnects, 1);
  EXPECT_EQ(pump.cancels, 1);
  EXPECT_EQ(notifier.cancels, 1);
  EXPECT_EQ(ended, (std::vector<SessionEnd>{SessionEnd::NotifierStopped}));
}

TEST_F(SessionManagerTest, PumpWinsWhenBothFinishTogether) {
  ASSERT_TRUE(session.begin(link, 0));
  pump.doneAtMs = 1;
  notifier.doneAtMs = 1;
  EXPECT_EQ(session.tick(1), SessionEnd::Disconnected);
}

TEST_F(SessionManagerTest, AbortReportsAbortedAndClosesLink) {
  ASSERT_TRUE(session.begin(link, 0));
  session.abort();
  EXPECT_FALSE(session.active());
  EXPECT_EQ(link.disconnects, 1);
  EXPECT_EQ(pump.cancels, 1);
  EXPECT_EQ(notifier.cancels, 1);
  EXPECT_EQ(ended, (std::vector<SessionEnd>{SessionEnd::Aborted}));

  // a second abort has nothing to end
  session.abort();
  EXPECT_EQ(ended.size(), 1u);
}
