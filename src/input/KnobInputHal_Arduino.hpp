#pragma once
#include "input/KnobInputHal.hpp"

class KnobInputHal_Arduino : public KnobInputHal {
public:
  KnobInputHal_Arduino(int pinA, int pinB, int pinButton, bool usePullup = true)
      : _pinA(pinA), _pinB(pinB), _pinButton(pinButton), _pullup(usePullup) {}

  void begin() override;
  uint32_t microsNow() const override;

  bool readA() const override;
  bool readB() const override;
  bool readButton() const override;

private:
  int  _pinA;
  int  _pinB;
  int  _pinButton;
  bool _pullup;
};
