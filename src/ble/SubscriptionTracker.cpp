#include "ble/SubscriptionTracker.hpp"

bool SubscriptionTracker::update(uint16_t handle, bool notify) {
  if (handle == 0) return false;

  Entry* freeSlot = nullptr;
  for (Entry& e : _entries) {
    if (e.handle == handle) {
      e.notify = notify;
      return true;
    }
    if (!freeSlot && e.handle == 0) freeSlot = &e;
  }
  // Unsubscribing a handle never seen is already the current state.
  if (!notify) return true;
  if (!freeSlot) return false;

  freeSlot->handle = handle;
  freeSlot->notify = true;
  return true;
}

bool SubscriptionTracker::subscribed(uint16_t handle) const {
  for (const Entry& e : _entries) {
    if (e.handle == handle) return e.notify;
  }
  return false;
}

void SubscriptionTracker::clear() {
  for (Entry& e : _entries) e = Entry();
}

size_t SubscriptionTracker::count() const {
  size_t n = 0;
  for (const Entry& e : _entries) {
    if (e.handle != 0 && e.notify) ++n;
  }
  return n;
}
