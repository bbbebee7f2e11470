#include "ble/AdvertisingController.hpp"

bool AdvertisingController::start(const char* name, const uint16_t* uuids16, size_t uuidCount) {
  _link  = nullptr;
  _error = HostError::None;

  if (!encodeAdvertisingPayload(name, uuids16, uuidCount, _payload)) {
    _error = HostError::AdvertisingData;
    _state = State::Failed;
    return false;
  }

  HostError err = HostError::None;
  if (!_peripheral.startAdvertising(_payload.bytes, _payload.len, err)) {
    _error = err == HostError::None ? HostError::AdvertisingStart : err;
    _state = State::Failed;
    return false;
  }
  _state = State::Advertising;
  return true;
}

AdvertisingController::State AdvertisingController::tick() {
  if (_state != State::Advertising) return _state;

  BleLink* link = nullptr;
  HostError err = HostError::None;
  switch (_peripheral.pollAccept(link, err)) {
    case BlePeripheral::AcceptState::Pending:
      break;
    case BlePeripheral::AcceptState::Connected:
      if (link) {
        _link  = link;
        _state = State::Connected;
      } else {
        _error = HostError::Accept;
        _state = State::Failed;
      }
      break;
    case BlePeripheral::AcceptState::Failed:
      _error = err == HostError::None ? HostError::Accept : err;
      _state = State::Failed;
      break;
  }
  return _state;
}

void AdvertisingController::stop() {
  if (_state == State::Advertising) _peripheral.stopAdvertising();
  _state = State::Idle;
  _link  = nullptr;
}
