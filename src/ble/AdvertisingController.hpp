// File Overview: Drives the advertise -> accept cycle of the host for one
// connection window at a time.
#pragma once
#include <stddef.h>
#include <stdint.h>

#include "ble/AdvertisingPayload.hpp"
#include "ble/BleLink.hpp"

class AdvertisingController {
public:
  enum class State : uint8_t { Idle, Advertising, Connected, Failed };

  explicit AdvertisingController(BlePeripheral& peripheral) : _peripheral(peripheral) {}

  // Encodes flags, name and service list and submits them. On failure the
  // state is Failed and error() says why.
  bool start(const char* name, const uint16_t* uuids16, size_t uuidCount);

  // Polls for an accepted connection while Advertising.
  State tick();

  void stop();

  State state() const { return _state; }
  HostError error() const { return _error; }
  BleLink* link() const { return _link; }
  const AdvertisingPayload& payload() const { return _payload; }

private:
  BlePeripheral&     _peripheral;
  AdvertisingPayload _payload;
  State     _state = State::Idle;
  HostError _error = HostError::None;
  BleLink*  _link  = nullptr;
};
