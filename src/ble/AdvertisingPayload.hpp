// File Overview: Encodes the legacy advertising data (flags, complete local
// name, 16-bit service UUID list) into the 31-byte link-layer limit.
#pragma once
#include <stddef.h>
#include <stdint.h>

namespace adv {

constexpr size_t  kMaxLen = 31;

constexpr uint8_t kTypeFlags          = 0x01;
constexpr uint8_t kTypeComplete16     = 0x03;
constexpr uint8_t kTypeCompleteName   = 0x09;

constexpr uint8_t kFlagLeGeneralDisc  = 0x02;
constexpr uint8_t kFlagBrEdrNotSupp   = 0x04;

}  // namespace adv

struct AdvertisingPayload {
  uint8_t bytes[adv::kMaxLen] = {};
  size_t  len = 0;
};

// Returns false when the structures do not fit; out is left with len 0.
bool encodeAdvertisingPayload(const char* name, const uint16_t* uuids16, size_t uuidCount,
                              AdvertisingPayload& out);
