#include "input/KnobInputHal_Arduino.hpp"

#include <Arduino.h>

void KnobInputHal_Arduino::begin() {
  const uint8_t mode = _pullup ? INPUT_PULLUP : INPUT_PULLDOWN;
  pinMode(_pinA, mode);
  pinMode(_pinB, mode);
  if (_pinButton >= 0) pinMode(_pinButton, mode);
}

uint32_t KnobInputHal_Arduino::microsNow() const { return micros(); }

bool KnobInputHal_Arduino::readA() const { return digitalRead(_pinA) == HIGH; }
bool KnobInputHal_Arduino::readB() const { return digitalRead(_pinB) == HIGH; }

bool KnobInputHal_Arduino::readButton() const {
  // no button fitted: report the idle (pulled-up) level
  if (_pinButton < 0) return _pullup;
  return digitalRead(_pinButton) == HIGH;
}
