// File Overview: Declares the press-then-auto-release HID reporter. Each knob
// detent is sent as a full key cycle: the key's report, a short gap, then the
// empty report.
#pragma once
#include <stdint.h>

#include "hid/KeyState.hpp"

class BleLink;
class GattTable;

class HidReporter {
public:
  enum class Status : uint8_t { Idle, Releasing, Failed };

  static constexpr uint32_t kDefaultReleaseMs = 50;

  explicit HidReporter(GattTable& table, uint32_t releaseDelayMs = kDefaultReleaseMs)
      : _table(table), _releaseDelayMs(releaseDelayMs) {}

  void begin(BleLink& link);

  // Sends the press report now and schedules the release. Returns false when
  // a cycle is already in flight or the notification failed (status() is
  // Failed in the latter case).
  bool sendKey(KeyState key, uint32_t nowMs);

  // Sends the release once the gap has elapsed.
  Status tick(uint32_t nowMs);

  // Drops an in-flight cycle without sending anything further.
  void cancel();

  Status status() const { return _status; }
  bool busy() const { return _status == Status::Releasing; }
  KeyState lastKey() const { return _key; }
  uint16_t failedHandle() const { return _failedHandle; }

  void setReleaseDelay(uint32_t ms) { _releaseDelayMs = ms; }
  uint32_t releaseDelay() const { return _releaseDelayMs; }

private:
  bool push(KeyState key);

  GattTable& _table;
  BleLink*   _link = nullptr;
  uint32_t   _releaseDelayMs;
  uint32_t   _releaseAtMs  = 0;
  Status     _status       = Status::Idle;
  KeyState   _key          = KeyState::None;
  uint16_t   _failedHandle = 0;
};
