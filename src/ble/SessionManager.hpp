// File Overview: Owns one connection for its lifetime and races the GATT event
// pump against the application notifier; whichever finishes first ends the
// session and the other is cancelled.
#pragma once
#include <stdint.h>

#include "ble/BleLink.hpp"
#include "ble/BondTracker.hpp"
#include "ble/SessionCallbacks.hpp"
#include "ble/SessionTask.hpp"

class SessionManager {
public:
  SessionManager(SessionTask& pump, SessionTask& notifier, BondTracker& bonds,
                 const SessionCallbacks& callbacks)
      : _pump(pump), _notifier(notifier), _bonds(bonds), _callbacks(callbacks) {}

  // Marks the link bondable iff no bond is held, then starts both tasks.
  // Returns false (and leaves no session running) if the link is unusable.
  bool begin(BleLink& link, uint32_t nowMs);

  // Runs one step of each task. Returns SessionEnd::None while the session
  // continues; otherwise the session is over and both tasks are stopped.
  SessionEnd tick(uint32_t nowMs);

  // Tears the session down from outside (console `forget`).
  void abort();

  bool active() const { return _link != nullptr; }
  BleLink* link() const { return _link; }

private:
  SessionEnd finish(SessionEnd why);

  SessionTask&            _pump;
  SessionTask&            _notifier;
  BondTracker&            _bonds;
  const SessionCallbacks& _callbacks;
  BleLink* _link = nullptr;
};
