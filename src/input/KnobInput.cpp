#include "input/KnobInput.hpp"

void KnobInput::begin(const Config& cfg) {
  _cfg = cfg;
  _hal.begin();
  const uint32_t now = _hal.microsNow();
  const bool a = _hal.readA();
  const bool b = _hal.readB();
  _a.begin(a, _cfg.debounceUs, now);
  _b.begin(b, _cfg.debounceUs, now);
  _button.begin(_hal.readButton(), _cfg.debounceUs, now);
  _decoder.reset(a, b);
  _dropped = 0;
  _detents = 0;
}

KeyState KnobInput::keyFor(RotationEvent ev, bool reversed) {
  switch (ev) {
    case RotationEvent::Left:  return reversed ? KeyState::VolUp : KeyState::VolDown;
    case RotationEvent::Right: return reversed ? KeyState::VolDown : KeyState::VolUp;
    case RotationEvent::None:  break;
  }
  return KeyState::None;
}

void KnobInput::enqueue(KeyState key) {
  if (!_keys.push(key)) ++_dropped;
}

void KnobInput::poll() {
  const uint32_t now = _hal.microsNow();

  // Both channels are sampled before decoding so a simultaneous change is a
  // single edge with both levels current.
  const bool edgeA = _a.update(_hal.readA(), now);
  const bool edgeB = _b.update(_hal.readB(), now);
  if (edgeA || edgeB) {
    const RotationEvent ev = _decoder.onEdge(_a.level(), _b.level());
    if (ev != RotationEvent::None) {
      ++_detents;
      enqueue(keyFor(ev, _cfg.reversed));
    }
  }

  if (_button.update(_hal.readButton(), now)) {
    const bool pressed = _cfg.buttonActiveLow ? !_button.level() : _button.level();
    if (pressed) enqueue(KeyState::Mute);
  }
}
