// File Overview: The application side of a session: turns queued knob keys
// (or the demo toggle) into HID key cycles and keeps status notifications
// flowing. Completes as soon as any notification cannot be delivered.
#pragma once
#include <stdint.h>

#include "ble/SessionCallbacks.hpp"
#include "ble/SessionTask.hpp"
#include "ble/StatusNotifier.hpp"
#include "hid/HidReporter.hpp"
#include "hid/KeyQueue.hpp"
#include "hid/KeyState.hpp"

class KnobNotifier : public SessionTask {
public:
  static constexpr uint32_t kDefaultDemoPeriodMs = 2000;

  KnobNotifier(HidReporter& hid, StatusNotifier& status, KeyQueue& keys,
               const SessionCallbacks& callbacks)
      : _hid(hid), _status(status), _keys(keys), _callbacks(callbacks) {}

  // Demo mode ignores the key queue and alternates VolUp / VolDown.
  void setDemoMode(bool on, uint32_t periodMs = kDefaultDemoPeriodMs);
  bool demoMode() const { return _demo; }

  void begin(BleLink& link, uint32_t nowMs) override;
  bool tick(uint32_t nowMs) override;
  void cancel() override;

private:
  bool nextKey(uint32_t nowMs, KeyState& key);
  bool fail(uint16_t handle);

  HidReporter&            _hid;
  StatusNotifier&         _status;
  KeyQueue&               _keys;
  const SessionCallbacks& _callbacks;

  bool     _active       = false;
  bool     _done         = false;
  bool     _demo         = false;
  bool     _demoUp       = true;
  uint32_t _demoPeriodMs = kDefaultDemoPeriodMs;
  uint32_t _demoNextMs   = 0;
};
