// File Overview: Remembers which characteristic value handles the connected
// central has enabled notifications on (its CCCD writes). Notifications on any
// other handle are skipped.
#pragma once
#include <stddef.h>
#include <stdint.h>

class SubscriptionTracker {
public:
  static constexpr size_t kMaxHandles = 8;

  // Records a CCCD change. False when the table is full and the handle is new.
  bool update(uint16_t handle, bool notify);
  bool subscribed(uint16_t handle) const;
  void clear();

  size_t count() const;

private:
  struct Entry {
    uint16_t handle = 0;
    bool     notify = false;
  };

  Entry _entries[kMaxHandles];
};
