// File Overview: Seams between the knob's session logic and the BLE host stack:
// connection events, the live link, and the advertising peripheral.
#pragma once
#include <stddef.h>
#include <stdint.h>

#include "ble/BleTypes.hpp"
#include "ble/GattRequest.hpp"

struct ConnectionEvent {
  enum class Type : uint8_t {
    None,
    Disconnected,     // reason
    PassKeyDisplay,   // passkey
    PassKeyConfirm,   // passkey (numeric comparison value)
    PassKeyInput,
    PairingComplete,  // level, hasBond, bond
    PairingFailed,    // error
    Gatt,             // request
    Other,            // code (raw host event id)
  };

  Type          type     = Type::None;
  uint8_t       reason   = 0;
  uint32_t      passkey  = 0;
  SecurityLevel level    = SecurityLevel::NoEncryption;
  bool          hasBond  = false;
  BondInformation bond{};
  int           error    = 0;
  int           code     = 0;
  GattRequest   request;
};

// One live connection to a central. Owned by the host adapter; the session
// code borrows it between accept and disconnect.
class BleLink {
public:
  virtual ~BleLink() = default;

  virtual uint16_t connHandle() const = 0;
  virtual bool isOpen() const = 0;

  // False when the link is gone and the level cannot be read.
  virtual bool securityLevel(SecurityLevel& out) const = 0;
  virtual bool setBondable(bool bondable) = 0;
  virtual bool confirmPasskey(bool accept) = 0;
  // Drop stored keys for a peer whose bond the device no longer keeps.
  virtual void forgetPeer(const BondInformation& bond) = 0;

  // Non-blocking. Events come out in the order the host produced them.
  virtual bool pollEvent(ConnectionEvent& out) = 0;

  // Value notification on an attribute handle. A handle the central has not
  // subscribed to is skipped and still reports true. False once the link is gone.
  virtual bool notify(uint16_t handle, const uint8_t* data, size_t len) = 0;

  virtual void disconnect() = 0;
};

class BlePeripheral {
public:
  enum class AcceptState : uint8_t { Pending, Connected, Failed };

  virtual ~BlePeripheral() = default;

  virtual bool startAdvertising(const uint8_t* advData, size_t len, HostError& err) = 0;
  virtual void stopAdvertising() = 0;

  // Polled while advertising. On Connected, link is set and stays valid until
  // the next startAdvertising(); on Failed, err says why.
  virtual AcceptState pollAccept(BleLink*& link, HostError& err) = 0;
};
