// File Overview: Runtime settings for the knob with compile-time defaults and
// the safety ranges every stored or console-entered value is clamped to.
#pragma once
#include <stddef.h>
#include <stdint.h>

#ifndef KNOB_DEVICE_NAME
#define KNOB_DEVICE_NAME "Simple Volume Knob"
#endif

struct KnobConfig {
  // What fits in the advertisement next to flags and the service list.
  static constexpr size_t kNameCap = 20;

  static constexpr uint32_t DEBOUNCE_MIN_US   = 200;
  static constexpr uint32_t DEBOUNCE_MAX_US   = 20000;
  static constexpr uint32_t RELEASE_MIN_MS    = 10;
  static constexpr uint32_t RELEASE_MAX_MS    = 500;
  static constexpr uint32_t STATUS_MIN_MS     = 1000;
  static constexpr uint32_t STATUS_MAX_MS     = 600000;
  static constexpr uint32_t RETRY_MIN_MS      = 100;
  static constexpr uint32_t RETRY_MAX_MS      = 60000;

  char     deviceName[kNameCap + 1] = KNOB_DEVICE_NAME;
  uint32_t debounceUs       = 1000;
  uint32_t releaseDelayMs   = 50;
  uint32_t statusIntervalMs = 30000;
  uint32_t advertiseRetryMs = 1000;
  bool     reversed         = false;
  bool     demoMode         = false;

  // Copies a printable-ASCII name, truncated to kNameCap. Returns false (name
  // unchanged) for empty or non-printable input.
  bool setName(const char* name);

  // Clamp everything into its safe range; restores the default name if the
  // stored one is unusable.
  void sanitize();
};
