#include "ble/SessionManager.hpp"

bool SessionManager::begin(BleLink& link, uint32_t nowMs) {
  if (!link.setBondable(_bonds.allowBonding())) {
    if (link.isOpen()) link.disconnect();
    return false;
  }
  _link = &link;
  _pump.begin(link, nowMs);
  _notifier.begin(link, nowMs);
  return true;
}

SessionEnd SessionManager::tick(uint32_t nowMs) {
  if (!_link) return SessionEnd::None;
  if (_pump.tick(nowMs)) {
    return finish(SessionEnd::Disconnected);
  }
  if (_notifier.tick(nowMs)) {
    return finish(SessionEnd::NotifierStopped);
  }
  return SessionEnd::None;
}

void SessionManager::abort() {
  if (_link) finish(SessionEnd::Aborted);
}

SessionEnd SessionManager::finish(SessionEnd why) {
  _pump.cancel();
  _notifier.cancel();
  // one link at a time: never leave a half-dead connection behind
  if (_link->isOpen()) _link->disconnect();
  _link = nullptr;
  if (_callbacks.onSessionEnded) _callbacks.onSessionEnded(why);
  return why;
}
