#include "ble/BondTracker.hpp"

bool BondTracker::assign(const BondInformation* bond, BondInformation* discarded) {
  const bool dropsPeer = _hasBond && (!bond || !bond->samePeer(_bond));
  if (dropsPeer && discarded) {
    *discarded = _bond;
  }
  if (bond) {
    _bond    = *bond;
    _hasBond = true;
  } else {
    _bond    = BondInformation{};
    _hasBond = false;
  }
  return dropsPeer;
}

void BondTracker::clear() {
  _bond    = BondInformation{};
  _hasBond = false;
}
