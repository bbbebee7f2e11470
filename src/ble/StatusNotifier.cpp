#include "ble/StatusNotifier.hpp"

#include "ble/BleLink.hpp"
#include "ble/GattTable.hpp"

void StatusNotifier::begin(BleLink& link, uint32_t nowMs) {
  _link         = &link;
  _nextDueMs    = nowMs + _intervalMs;
  _sentBattery  = _table.byteValue(AttrId::BatteryLevel);
  _sentStatus   = _table.byteValue(AttrId::Status);
  _failedHandle = 0;
}

void StatusNotifier::cancel() {
  _link = nullptr;
}

bool StatusNotifier::pushBattery() {
  const uint8_t level = _table.byteValue(AttrId::BatteryLevel);
  const uint16_t handle = _table.handle(AttrId::BatteryLevel);
  if (!_link->notify(handle, &level, 1)) {
    _failedHandle = handle;
    return false;
  }
  _sentBattery = level;
  return true;
}

bool StatusNotifier::pushStatus() {
  const uint8_t status = _table.byteValue(AttrId::Status);
  const uint16_t handle = _table.handle(AttrId::Status);
  if (!_link->notify(handle, &status, 1)) {
    _failedHandle = handle;
    return false;
  }
  _sentStatus = status;
  return true;
}

bool StatusNotifier::tick(uint32_t nowMs) {
  if (!_link) return true;

  const bool due = (int32_t)(nowMs - _nextDueMs) >= 0;
  if (due || _table.byteValue(AttrId::BatteryLevel) != _sentBattery) {
    if (!pushBattery()) return false;
  }
  if (due || _table.byteValue(AttrId::Status) != _sentStatus) {
    if (!pushStatus()) return false;
  }
  if (due) _nextDueMs = nowMs + _intervalMs;
  return true;
}
