// File Overview: Single in-memory bond slot. Decides whether the next
// connection may bond; lost on power cycle.
#pragma once
#include "ble/BleTypes.hpp"

class BondTracker {
public:
  bool hasBond() const { return _hasBond; }
  const BondInformation& bond() const { return _bond; }

  // Bondable iff nothing is held yet; a device with a bonded peer does not
  // offer fresh pairing.
  bool allowBonding() const { return !_hasBond; }

  // Replaces the slot with the outcome of a completed pairing (nullptr when
  // the pairing produced no bond). When a bond for a different peer is
  // dropped, it is copied to *discarded and true is returned.
  bool assign(const BondInformation* bond, BondInformation* discarded = nullptr);

  void clear();

private:
  bool            _hasBond = false;
  BondInformation _bond{};
};
