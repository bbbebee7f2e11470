// File Overview: Stable-time filter for a single digital input. A new level is
// accepted only after it has held for the configured interval.
#pragma once
#include <stdint.h>

class Debouncer {
public:
  void begin(bool initialLevel, uint32_t stableUs, uint32_t nowUs);

  // Feed the raw pin level. Returns true exactly when the debounced level
  // changes; level() then holds the new value.
  bool update(bool rawLevel, uint32_t nowUs);

  bool level() const { return _stable; }
  uint32_t stableUs() const { return _stableUs; }

private:
  bool     _stable    = true;
  bool     _candidate = true;
  uint32_t _changedUs = 0;
  uint32_t _stableUs  = 1000;
};
