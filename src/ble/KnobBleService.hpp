// File Overview: Declares the knob's BLE service loop: advertise until a central
// connects, run one session, then advertise again. Advertising failures are
// retried after a back-off instead of halting the device.
#pragma once
#include <stdint.h>

#include "ble/AdvertisingController.hpp"
#include "ble/BleLink.hpp"
#include "ble/BondTracker.hpp"
#include "ble/GattEventDispatcher.hpp"
#include "ble/GattTable.hpp"
#include "ble/KnobNotifier.hpp"
#include "ble/SessionCallbacks.hpp"
#include "ble/SessionManager.hpp"
#include "ble/StatusNotifier.hpp"
#include "hid/HidReporter.hpp"

class KnobBleService {
public:
  enum class State : uint8_t { Idle, Advertising, InSession, Backoff };

  static constexpr uint32_t kDefaultRetryMs = 1000;
  // 31 bytes less flags (3), name header (2) and the two service UUIDs (6).
  static constexpr size_t   kMaxNameLen     = 20;

  KnobBleService(BlePeripheral& peripheral, GattTable& table, KeyQueue& keys,
                 const SessionCallbacks& callbacks);

  void begin(const char* deviceName, uint32_t nowMs);
  void tick(uint32_t nowMs);

  // Drops the remembered bond so the next connection may pair again.
  void forgetBond() { _bonds.clear(); }

  // Ends the live session or advertising window and advertises afresh.
  void restart(uint32_t nowMs);

  void setReleaseDelay(uint32_t ms) { _hid.setReleaseDelay(ms); }
  void setStatusInterval(uint32_t ms) { _status.setInterval(ms); }
  void setDemoMode(bool on) { _notifier.setDemoMode(on); }
  void setRetryDelay(uint32_t ms) { _retryMs = ms; }

  State state() const { return _state; }
  const BondTracker& bonds() const { return _bonds; }
  bool isConnected() const { return _state == State::InSession; }
  const char* deviceName() const { return _name; }

private:
  void startAdvertising(uint32_t nowMs);
  void enterBackoff(uint32_t nowMs);

  const SessionCallbacks& _callbacks;

  BondTracker           _bonds;
  AdvertisingController _advertiser;
  GattEventDispatcher   _dispatcher;
  HidReporter           _hid;
  StatusNotifier        _status;
  KnobNotifier          _notifier;
  SessionManager        _session;

  State    _state   = State::Idle;
  uint32_t _retryMs = kDefaultRetryMs;
  uint32_t _retryAtMs = 0;
  char     _name[kMaxNameLen + 1] = {};
};
