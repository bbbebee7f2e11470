#include "ble/BleTypes.hpp"

const char* securityLevelName(SecurityLevel level) {
  switch (level) {
    case SecurityLevel::NoEncryption:           return "none";
    case SecurityLevel::Encrypted:              return "encrypted";
    case SecurityLevel::EncryptedAuthenticated: return "authenticated";
  }
  return "?";
}

const char* hostErrorName(HostError err) {
  switch (err) {
    case HostError::None:             return "none";
    case HostError::AdvertisingData:  return "adv-data";
    case HostError::AdvertisingStart: return "adv-start";
    case HostError::Accept:           return "accept";
    case HostError::HostReset:        return "host-reset";
    case HostError::Disconnect:       return "disconnect";
  }
  return "?";
}

bool hostErrorIsTransient(HostError err) {
  return err == HostError::Disconnect;
}
