#include "power/BatteryGauge.hpp"

uint8_t batteryPercentFromMv(uint32_t mv, uint32_t emptyMv, uint32_t fullMv) {
  if (fullMv <= emptyMv) return 0;
  if (mv <= emptyMv) return 0;
  if (mv >= fullMv) return 100;
  return (uint8_t)(((mv - emptyMv) * 100u + (fullMv - emptyMv) / 2) / (fullMv - emptyMv));
}

uint8_t BatteryGauge::update(uint32_t mv) {
  if (!_seeded) {
    _avgMv  = mv;
    _seeded = true;
  } else {
    // 1/8 exponential moving average
    _avgMv = _avgMv - (_avgMv >> 3) + (mv >> 3);
  }
  _percent = batteryPercentFromMv(_avgMv);
  return _percent;
}
