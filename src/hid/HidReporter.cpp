#include "hid/HidReporter.hpp"

#include "ble/BleLink.hpp"
#include "ble/GattTable.hpp"

void HidReporter::begin(BleLink& link) {
  _link         = &link;
  _status       = Status::Idle;
  _key          = KeyState::None;
  _failedHandle = 0;
}

void HidReporter::cancel() {
  _link   = nullptr;
  _status = Status::Idle;
}

bool HidReporter::push(KeyState key) {
  const InputReport report = asReport(key);
  const uint16_t handle = _table.handle(AttrId::InputReport);
  _table.set(AttrId::InputReport, report.bytes, sizeof(report.bytes));
  if (!_link || !_link->notify(handle, report.bytes, sizeof(report.bytes))) {
    _failedHandle = handle;
    _status = Status::Failed;
    return false;
  }
  return true;
}

bool HidReporter::sendKey(KeyState key, uint32_t nowMs) {
  if (_status != Status::Idle) return false;
  _key = key;
  if (!push(key)) return false;
  _releaseAtMs = nowMs + _releaseDelayMs;
  _status = Status::Releasing;
  return true;
}

HidReporter::Status HidReporter::tick(uint32_t nowMs) {
  if (_status != Status::Releasing) return _status;
  if ((int32_t)(nowMs - _releaseAtMs) < 0) return _status;
  if (push(KeyState::None)) {
    _status = Status::Idle;
  }
  return _status;
}
