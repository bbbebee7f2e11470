#pragma once
#include <stdint.h>

// Pin access for the knob: two encoder channels and the push (mute) input.
class KnobInputHal {
public:
  virtual ~KnobInputHal() = default;

  virtual void begin() = 0;
  virtual uint32_t microsNow() const = 0;

  virtual bool readA() const = 0;
  virtual bool readB() const = 0;
  virtual bool readButton() const = 0;
};
