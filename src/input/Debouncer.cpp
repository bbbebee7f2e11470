#include "input/Debouncer.hpp"

void Debouncer::begin(bool initialLevel, uint32_t stableUs, uint32_t nowUs) {
  _stable    = initialLevel;
  _candidate = initialLevel;
  _changedUs = nowUs;
  _stableUs  = stableUs;
}

bool Debouncer::update(bool rawLevel, uint32_t nowUs) {
  if (rawLevel != _candidate) {
    // restart the stability window on every raw toggle
    _candidate = rawLevel;
    _changedUs = nowUs;
    return false;
  }
  if (_candidate == _stable) return false;
  if ((uint32_t)(nowUs - _changedUs) < _stableUs) return false;
  _stable = _candidate;
  return true;
}
