// File Overview: Plain value types shared by the knob's BLE session code and the
// NimBLE adapter (security levels, ATT error codes, bond records, host errors).
#pragma once
#include <stdint.h>
#include <string.h>

enum class SecurityLevel : uint8_t {
  NoEncryption,
  Encrypted,               // encrypted, unauthenticated (Just Works)
  EncryptedAuthenticated,  // MITM-protected pairing
};

inline bool isAuthenticated(SecurityLevel level) {
  return level == SecurityLevel::EncryptedAuthenticated;
}

const char* securityLevelName(SecurityLevel level);

// ATT protocol error codes (Bluetooth Core Vol 3, Part F, 3.4.1.1).
enum class AttError : uint8_t {
  None                        = 0x00,
  InvalidHandle               = 0x01,
  ReadNotPermitted            = 0x02,
  WriteNotPermitted           = 0x03,
  InsufficientAuthentication  = 0x05,
  RequestNotSupported         = 0x06,
  InvalidAttributeValueLength = 0x0D,
  UnlikelyError               = 0x0E,
};

enum class HostError : uint8_t {
  None,
  AdvertisingData,   // payload does not fit / could not be set
  AdvertisingStart,
  Accept,            // connection attempt failed or advertising ended
  HostReset,
  Disconnect,
};

const char* hostErrorName(HostError err);
// Errors that clear up on their own (a link still closing) rather than
// pointing at a broken host.
bool hostErrorIsTransient(HostError err);

struct BondInformation {
  uint8_t addrType = 0;
  uint8_t addr[6]  = {0, 0, 0, 0, 0, 0};
  uint8_t keySize  = 0;

  bool samePeer(const BondInformation& other) const {
    return addrType == other.addrType && memcmp(addr, other.addr, sizeof(addr)) == 0;
  }
};
