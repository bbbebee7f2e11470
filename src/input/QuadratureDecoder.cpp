#include "input/QuadratureDecoder.hpp"

namespace {
// A leads B on the way down (and back up for half-detent encoders).
constexpr uint8_t kLeftA      = 0b100;
constexpr uint8_t kLeftB      = 0b110;
constexpr uint8_t kLeftAInv   = 0b011;
constexpr uint8_t kLeftBInv   = 0b001;
// B leads A.
constexpr uint8_t kRightA     = 0b110;
constexpr uint8_t kRightB     = 0b100;
constexpr uint8_t kRightAInv  = 0b001;
constexpr uint8_t kRightBInv  = 0b011;
}  // namespace

void QuadratureDecoder::reset(bool levelA, bool levelB) {
  _histA = levelA ? 1 : 0;
  _histB = levelB ? 1 : 0;
}

RotationEvent QuadratureDecoder::onEdge(bool levelA, bool levelB) {
  _histA = (uint8_t)((_histA << 1) | (levelA ? 1 : 0));
  _histB = (uint8_t)((_histB << 1) | (levelB ? 1 : 0));

  const uint8_t a = _histA & kMask;
  const uint8_t b = _histB & kMask;

  if ((a == kLeftA && b == kLeftB) || (a == kLeftAInv && b == kLeftBInv)) {
    return RotationEvent::Left;
  }
  if ((a == kRightA && b == kRightB) || (a == kRightAInv && b == kRightBInv)) {
    return RotationEvent::Right;
  }
  return RotationEvent::None;
}
