// File Overview: Polls the knob pins, debounces them, runs the quadrature
// decoder and queues the resulting volume/mute keys for the BLE notifier.
#pragma once
#include <stdint.h>

#include "hid/KeyQueue.hpp"
#include "input/Debouncer.hpp"
#include "input/KnobInputHal.hpp"
#include "input/QuadratureDecoder.hpp"

class KnobInput {
public:
  struct Config {
    uint32_t debounceUs      = 1000;
    bool     reversed        = false;  // swap VolUp/VolDown
    bool     buttonActiveLow = true;   // pull-up wiring
  };

  KnobInput(KnobInputHal& hal, KeyQueue& keys) : _hal(hal), _keys(keys) {}

  void begin(const Config& cfg);

  // Call every loop pass; cheap when nothing moved.
  void poll();

  static KeyState keyFor(RotationEvent ev, bool reversed);

  uint32_t droppedKeys() const { return _dropped; }
  uint32_t detents() const { return _detents; }

private:
  void enqueue(KeyState key);

  KnobInputHal&     _hal;
  KeyQueue&         _keys;
  Config            _cfg;
  Debouncer         _a;
  Debouncer         _b;
  Debouncer         _button;
  QuadratureDecoder _decoder;
  uint32_t          _dropped = 0;
  uint32_t          _detents = 0;
};
