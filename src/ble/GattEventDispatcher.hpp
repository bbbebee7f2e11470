// File Overview: Declares the per-connection event pump: pairing/passkey
// handling, bond bookkeeping and the authentication gate on every read/write.
#pragma once
#include <stddef.h>
#include <stdint.h>

#include "ble/BleLink.hpp"
#include "ble/BondTracker.hpp"
#include "ble/GattTable.hpp"
#include "ble/SessionCallbacks.hpp"
#include "ble/SessionTask.hpp"

class GattEventDispatcher : public SessionTask {
public:
  enum class State : uint8_t { Idle, Active, Disconnected };

  static constexpr size_t kMaxEventsPerTick = 8;
  // Reported through onPairingFailed when the numeric comparison reply cannot be sent.
  static constexpr int kConfirmFailed = -1;

  GattEventDispatcher(BondTracker& bonds, const GattTable& table, const SessionCallbacks& callbacks)
      : _bonds(bonds), _table(table), _callbacks(callbacks) {}

  void begin(BleLink& link, uint32_t nowMs) override;
  // Drains pending events in host order; completes on Disconnected.
  bool tick(uint32_t nowMs) override;
  void cancel() override;

  State state() const { return _state; }
  uint8_t disconnectReason() const { return _reason; }

private:
  void handleEvent(ConnectionEvent& ev);
  void handlePairingComplete(const ConnectionEvent& ev);
  void handleGatt(GattRequest& request);

  BondTracker&            _bonds;
  const GattTable&        _table;
  const SessionCallbacks& _callbacks;
  BleLink* _link   = nullptr;
  State    _state  = State::Idle;
  uint8_t  _reason = 0;
};
