// File Overview: Declares the history-window quadrature decoder that turns
// debounced encoder edges into left/right detent events.
#pragma once
#include <stdint.h>

enum class RotationEvent : uint8_t { None, Left, Right };

// Both channel histories advance together on every edge from either channel,
// so the two windows always describe the same instants. Only the low 3 bits
// of each history take part in matching; a detent is recognised only once
// the full two-step gray-code pattern is present.
class QuadratureDecoder {
public:
  static constexpr uint8_t kWindowBits = 3;
  static constexpr uint8_t kMask       = (1u << kWindowBits) - 1;

  // Seed the histories with the resting levels of both channels.
  explicit QuadratureDecoder(bool levelA = true, bool levelB = true) { reset(levelA, levelB); }

  void reset(bool levelA, bool levelB);

  // Call once per debounced level change on either channel with the levels
  // read right after the change.
  RotationEvent onEdge(bool levelA, bool levelB);

  uint8_t historyA() const { return _histA & kMask; }
  uint8_t historyB() const { return _histB & kMask; }

private:
  uint8_t _histA = 0;
  uint8_t _histB = 0;
};
