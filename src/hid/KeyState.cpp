#include "hid/KeyState.hpp"

namespace {
constexpr uint8_t kBitVolUp   = 1 << 0;
constexpr uint8_t kBitVolDown = 1 << 1;
constexpr uint8_t kBitMute    = 1 << 2;
}  // namespace

const uint8_t kHidReportMap[] = {
  0x05, 0x0C,  // Usage Page (Consumer)
  0x09, 0x01,  // Usage (Consumer Control)
  0xA1, 0x01,  // Collection (Application)
  0x75, 0x08,  //   Report Size (8)
  0x95, 0x01,  //   Report Count (1)
  0x81, 0x01,  //   Input (Const) -- report id byte
  0x15, 0x00,  //   Logical Minimum (0)
  0x25, 0x01,  //   Logical Maximum (1)
  0x75, 0x01,  //   Report Size (1)
  0x95, 0x03,  //   Report Count (3)
  0x09, 0xE9,  //   Usage (Volume Increment)
  0x09, 0xEA,  //   Usage (Volume Decrement)
  0x09, 0xE2,  //   Usage (Mute)
  0x81, 0x02,  //   Input (Data,Var,Abs)
  0x95, 0x05,  //   Report Count (5)
  0x81, 0x01,  //   Input (Const) -- padding
  0xC0         // End Collection
};
const size_t kHidReportMapLen = sizeof(kHidReportMap);

InputReport asReport(KeyState key) {
  uint8_t bits = 0;
  switch (key) {
    case KeyState::VolUp:   bits = kBitVolUp;   break;
    case KeyState::VolDown: bits = kBitVolDown; break;
    case KeyState::Mute:    bits = kBitMute;    break;
    case KeyState::None:    bits = 0;           break;
  }
  InputReport r{{kHidInputReportId, bits}};
  return r;
}

const char* keyName(KeyState key) {
  switch (key) {
    case KeyState::VolUp:   return "VolUp";
    case KeyState::VolDown: return "VolDown";
    case KeyState::Mute:    return "Mute";
    case KeyState::None:    return "None";
  }
  return "?";
}
