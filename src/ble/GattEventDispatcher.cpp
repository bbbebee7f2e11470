#include "ble/GattEventDispatcher.hpp"

void GattEventDispatcher::begin(BleLink& link, uint32_t nowMs) {
  (void)nowMs;
  _link   = &link;
  _state  = State::Active;
  _reason = 0;
}

void GattEventDispatcher::cancel() {
  _link  = nullptr;
  _state = State::Idle;
}

bool GattEventDispatcher::tick(uint32_t nowMs) {
  (void)nowMs;
  if (_state == State::Disconnected) return true;
  if (_state != State::Active || !_link) return false;

  for (size_t i = 0; i < kMaxEventsPerTick && _state == State::Active; ++i) {
    ConnectionEvent ev;
    if (!_link->pollEvent(ev)) break;
    handleEvent(ev);
  }
  return _state == State::Disconnected;
}

void GattEventDispatcher::handleEvent(ConnectionEvent& ev) {
  switch (ev.type) {
    case ConnectionEvent::Type::Disconnected:
      _reason = ev.reason;
      _state  = State::Disconnected;
      if (_callbacks.onDisconnected) _callbacks.onDisconnected(ev.reason);
      break;

    case ConnectionEvent::Type::PassKeyDisplay:
      if (_callbacks.onPasskeyDisplay) _callbacks.onPasskeyDisplay(ev.passkey);
      break;

    case ConnectionEvent::Type::PassKeyConfirm:
      // No user-interaction path: numeric comparison is always accepted.
      if (_callbacks.onPasskeyConfirm) _callbacks.onPasskeyConfirm(ev.passkey);
      if (!_link->confirmPasskey(true) && _callbacks.onPairingFailed) {
        _callbacks.onPairingFailed(kConfirmFailed);
      }
      break;

    case ConnectionEvent::Type::PassKeyInput:
      if (_callbacks.onPasskeyInput) _callbacks.onPasskeyInput();
      break;

    case ConnectionEvent::Type::PairingComplete:
      handlePairingComplete(ev);
      break;

    case ConnectionEvent::Type::PairingFailed:
      if (_callbacks.onPairingFailed) _callbacks.onPairingFailed(ev.error);
      break;

    case ConnectionEvent::Type::Gatt:
      handleGatt(ev.request);
      break;

    case ConnectionEvent::Type::None:
    case ConnectionEvent::Type::Other:
      break;
  }
}

void GattEventDispatcher::handlePairingComplete(const ConnectionEvent& ev) {
  BondInformation discarded;
  const bool dropped = _bonds.assign(ev.hasBond ? &ev.bond : nullptr, &discarded);
  if (dropped) {
    _link->forgetPeer(discarded);
  }
  if (_callbacks.onPairingComplete) _callbacks.onPairingComplete(ev.level, ev.hasBond ? &ev.bond : nullptr);
}

void GattEventDispatcher::handleGatt(GattRequest& request) {
  const GattOp   op     = request.op();
  const uint16_t handle = request.handle();

  SecurityLevel level = SecurityLevel::NoEncryption;
  AttError sent;
  if (!_link->securityLevel(level)) {
    sent = request.reject(AttError::UnlikelyError);
  } else if (!isAuthenticated(level)) {
    sent = request.reject(AttError::InsufficientAuthentication);
  } else {
    sent = request.accept();
  }

  if (_callbacks.onGattAccess) _callbacks.onGattAccess(op, handle, _table.nameForHandle(handle), sent);
}
