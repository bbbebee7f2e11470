// File Overview: Observer hooks for the knob's BLE lifecycle. The portable
// session code reports through these; the firmware wires them to ESP_LOGx.
#pragma once
#include <functional>
#include <stdint.h>

#include "ble/BleTypes.hpp"
#include "ble/GattRequest.hpp"
#include "hid/KeyState.hpp"

enum class SessionEnd : uint8_t { None, Disconnected, NotifierStopped, Aborted };

struct SessionCallbacks {
  std::function<void(const char*)>      onAdvertising;      // device name
  std::function<void(HostError)>        onAdvertiseFailed;
  std::function<void(uint16_t)>         onConnected;        // connection handle
  std::function<void(uint32_t)>         onPasskeyDisplay;
  std::function<void(uint32_t)>         onPasskeyConfirm;
  std::function<void()>                 onPasskeyInput;
  std::function<void(SecurityLevel, const BondInformation*)> onPairingComplete;  // level, bond (null if none)
  std::function<void(int)>              onPairingFailed;
  std::function<void(GattOp, uint16_t, const char*, AttError)> onGattAccess;  // op, handle, name, reply
  std::function<void(uint8_t)>          onDisconnected;     // HCI reason
  std::function<void(SessionEnd)>       onSessionEnded;
  std::function<void(KeyState)>         onKeySent;
  std::function<void(uint16_t)>         onNotifyFailed;     // handle
};
