#include "ble/AdvertisingPayload.hpp"

#include <string.h>

namespace {

// AD structure: [len][type][data...], len counts type + data.
bool appendStructure(AdvertisingPayload& p, uint8_t type, const uint8_t* data, size_t len) {
  if (p.len + 2 + len > adv::kMaxLen) return false;
  p.bytes[p.len++] = (uint8_t)(len + 1);
  p.bytes[p.len++] = type;
  if (len) memcpy(&p.bytes[p.len], data, len);
  p.len += len;
  return true;
}

}  // namespace

bool encodeAdvertisingPayload(const char* name, const uint16_t* uuids16, size_t uuidCount,
                              AdvertisingPayload& out) {
  AdvertisingPayload p;

  const uint8_t flags = adv::kFlagLeGeneralDisc | adv::kFlagBrEdrNotSupp;
  bool ok = appendStructure(p, adv::kTypeFlags, &flags, 1);

  if (ok && name && name[0]) {
    ok = appendStructure(p, adv::kTypeCompleteName,
                         reinterpret_cast<const uint8_t*>(name), strlen(name));
  }

  if (ok && uuids16 && uuidCount) {
    uint8_t list[adv::kMaxLen];
    if (uuidCount * 2 > sizeof(list)) {
      ok = false;
    } else {
      for (size_t i = 0; i < uuidCount; ++i) {
        list[i * 2]     = (uint8_t)(uuids16[i] & 0xFF);
        list[i * 2 + 1] = (uint8_t)(uuids16[i] >> 8);
      }
      ok = appendStructure(p, adv::kTypeComplete16, list, uuidCount * 2);
    }
  }

  if (!ok) {
    out = AdvertisingPayload{};
    return false;
  }
  out = p;
  return true;
}
