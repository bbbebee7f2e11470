#include "config/KnobConfig.hpp"

#include <string.h>

namespace {

bool printableName(const char* s) {
  if (!s || !s[0]) return false;
  for (const char* p = s; *p; ++p) {
    if (*p < 0x20 || *p > 0x7E) return false;
  }
  return true;
}

template <typename T>
T clampTo(T v, T lo, T hi) {
  if (v < lo) return lo;
  if (v > hi) return hi;
  return v;
}

}  // namespace

bool KnobConfig::setName(const char* name) {
  if (!printableName(name)) return false;
  strncpy(deviceName, name, kNameCap);
  deviceName[kNameCap] = '\0';
  return true;
}

void KnobConfig::sanitize() {
  deviceName[kNameCap] = '\0';
  if (!printableName(deviceName)) {
    strncpy(deviceName, KNOB_DEVICE_NAME, kNameCap);
    deviceName[kNameCap] = '\0';
  }
  debounceUs       = clampTo(debounceUs, DEBOUNCE_MIN_US, DEBOUNCE_MAX_US);
  releaseDelayMs   = clampTo(releaseDelayMs, RELEASE_MIN_MS, RELEASE_MAX_MS);
  statusIntervalMs = clampTo(statusIntervalMs, STATUS_MIN_MS, STATUS_MAX_MS);
  advertiseRetryMs = clampTo(advertiseRetryMs, RETRY_MIN_MS, RETRY_MAX_MS);
}
