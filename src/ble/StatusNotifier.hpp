// File Overview: Pushes the battery level and status flag to the connected
// central on a fixed period and as soon as the battery value moves.
#pragma once
#include <stdint.h>

class BleLink;
class GattTable;

class StatusNotifier {
public:
  static constexpr uint32_t kDefaultIntervalMs = 30000;

  explicit StatusNotifier(GattTable& table, uint32_t intervalMs = kDefaultIntervalMs)
      : _table(table), _intervalMs(intervalMs) {}

  void begin(BleLink& link, uint32_t nowMs);
  // Returns false once a notification could not be delivered.
  bool tick(uint32_t nowMs);
  void cancel();

  void setInterval(uint32_t ms) { _intervalMs = ms; }
  uint16_t failedHandle() const { return _failedHandle; }

private:
  bool pushBattery();
  bool pushStatus();

  GattTable& _table;
  BleLink*   _link = nullptr;
  uint32_t   _intervalMs;
  uint32_t   _nextDueMs    = 0;
  uint8_t    _sentBattery  = 0;
  uint8_t    _sentStatus   = 0;
  uint16_t   _failedHandle = 0;
};
