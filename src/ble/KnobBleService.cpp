#include "ble/KnobBleService.hpp"

#include <string.h>

namespace {
const uint16_t kAdvertisedServices[] = {
  gatt_uuid::kHidService,
  gatt_uuid::kBatteryService,
};
constexpr size_t kAdvertisedServiceCount = sizeof(kAdvertisedServices) / sizeof(kAdvertisedServices[0]);
}  // namespace

KnobBleService::KnobBleService(BlePeripheral& peripheral, GattTable& table, KeyQueue& keys,
                               const SessionCallbacks& callbacks)
    : _callbacks(callbacks),
      _advertiser(peripheral),
      _dispatcher(_bonds, table, callbacks),
      _hid(table),
      _status(table),
      _notifier(_hid, _status, keys, callbacks),
      _session(_dispatcher, _notifier, _bonds, callbacks) {}

void KnobBleService::begin(const char* deviceName, uint32_t nowMs) {
  const char* name = deviceName && deviceName[0] ? deviceName : "Simple Volume Knob";
  strncpy(_name, name, kMaxNameLen);
  _name[kMaxNameLen] = '\0';
  startAdvertising(nowMs);
}

void KnobBleService::restart(uint32_t nowMs) {
  if (_state == State::Idle) return;
  if (_state == State::InSession) {
    _session.abort();
  } else if (_state == State::Advertising) {
    _advertiser.stop();
  }
  startAdvertising(nowMs);
}

void KnobBleService::startAdvertising(uint32_t nowMs) {
  if (_advertiser.start(_name, kAdvertisedServices, kAdvertisedServiceCount)) {
    _state = State::Advertising;
    if (_callbacks.onAdvertising) _callbacks.onAdvertising(_name);
    return;
  }
  if (_callbacks.onAdvertiseFailed) _callbacks.onAdvertiseFailed(_advertiser.error());
  enterBackoff(nowMs);
}

void KnobBleService::enterBackoff(uint32_t nowMs) {
  _state     = State::Backoff;
  _retryAtMs = nowMs + _retryMs;
}

void KnobBleService::tick(uint32_t nowMs) {
  switch (_state) {
    case State::Idle:
      break;

    case State::Advertising: {
      const AdvertisingController::State st = _advertiser.tick();
      if (st == AdvertisingController::State::Connected) {
        BleLink* link = _advertiser.link();
        if (_callbacks.onConnected) _callbacks.onConnected(link->connHandle());
        if (_session.begin(*link, nowMs)) {
          _state = State::InSession;
        } else {
          if (_callbacks.onSessionEnded) _callbacks.onSessionEnded(SessionEnd::Disconnected);
          startAdvertising(nowMs);
        }
      } else if (st == AdvertisingController::State::Failed) {
        if (_callbacks.onAdvertiseFailed) _callbacks.onAdvertiseFailed(_advertiser.error());
        enterBackoff(nowMs);
      }
      break;
    }

    case State::InSession:
      if (_session.tick(nowMs) != SessionEnd::None) {
        startAdvertising(nowMs);
      }
      break;

    case State::Backoff:
      if ((int32_t)(nowMs - _retryAtMs) >= 0) startAdvertising(nowMs);
      break;
  }
}
