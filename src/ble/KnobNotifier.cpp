#include "ble/KnobNotifier.hpp"

void KnobNotifier::setDemoMode(bool on, uint32_t periodMs) {
  _demo = on;
  _demoPeriodMs = periodMs;
}

void KnobNotifier::begin(BleLink& link, uint32_t nowMs) {
  // keys turned while nobody was listening are stale
  _keys.clear();
  _hid.begin(link);
  _status.begin(link, nowMs);
  _demoUp     = true;
  _demoNextMs = nowMs;
  _active     = true;
  _done       = false;
}

void KnobNotifier::cancel() {
  _hid.cancel();
  _status.cancel();
  _active = false;
}

bool KnobNotifier::fail(uint16_t handle) {
  if (_callbacks.onNotifyFailed) _callbacks.onNotifyFailed(handle);
  _hid.cancel();
  _status.cancel();
  _active = false;
  _done   = true;
  return true;
}

bool KnobNotifier::nextKey(uint32_t nowMs, KeyState& key) {
  if (!_demo) return _keys.pop(key);
  if ((int32_t)(nowMs - _demoNextMs) < 0) return false;
  key = _demoUp ? KeyState::VolUp : KeyState::VolDown;
  _demoUp = !_demoUp;
  _demoNextMs = nowMs + _hid.releaseDelay() + _demoPeriodMs;
  return true;
}

bool KnobNotifier::tick(uint32_t nowMs) {
  if (_done) return true;
  if (!_active) return false;

  if (_hid.tick(nowMs) == HidReporter::Status::Failed) {
    return fail(_hid.failedHandle());
  }

  KeyState key;
  if (!_hid.busy() && nextKey(nowMs, key)) {
    if (!_hid.sendKey(key, nowMs)) {
      return fail(_hid.failedHandle());
    }
    if (_callbacks.onKeySent) _callbacks.onKeySent(key);
  }

  if (!_status.tick(nowMs)) {
    return fail(_status.failedHandle());
  }
  return false;
}
