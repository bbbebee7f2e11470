// File Overview: Turns the battery sense voltage into the 0-100 % value the
// Battery service reports, smoothed so ADC noise does not spam notifications.
#pragma once
#include <stdint.h>

// Linear between empty and full, clamped.
uint8_t batteryPercentFromMv(uint32_t mv, uint32_t emptyMv = 3300, uint32_t fullMv = 4200);

class BatteryGauge {
public:
  // First sample seeds the filter.
  uint8_t update(uint32_t mv);
  uint8_t percent() const { return _percent; }

private:
  bool     _seeded  = false;
  uint32_t _avgMv   = 0;
  uint8_t  _percent = 100;
};
