// File Overview: Declares the NimBLE-backed host adapter. It registers the knob's
// attribute table with the NimBLE GATT server, runs advertising and the single
// connection, and hands every GAP/GATT event to the loop() task in host order.
#pragma once

#include <Arduino.h>
#include <NimBLEDevice.h>

#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/semphr.h>

extern "C" {
  #include "host/ble_hs.h"
  #include "host/ble_gap.h"
  #include "host/ble_gatt.h"
  #include "host/ble_store.h"
}

#include "ble/BleLink.hpp"
#include "ble/GattRequest.hpp"
#include "ble/GattTable.hpp"
#include "ble/SubscriptionTracker.hpp"

class NimBleHost : public BlePeripheral, public BleLink, public GattResponder {
public:
  static constexpr UBaseType_t kEventQueueDepth = 16;
  static constexpr uint32_t    kAccessTimeoutMs = 500;
  static constexpr uint32_t    kTeardownWaitMs  = 300;

  // NimBLE init, security setup, GATT registration. Clears any bonds the
  // stack store still holds so the in-memory tracker and the stack agree.
  bool begin(const char* deviceName, GattTable& table);

  // Wipes every bond from the stack store.
  void forgetAllBonds();

  // BlePeripheral
  bool startAdvertising(const uint8_t* advData, size_t len, HostError& err) override;
  void stopAdvertising() override;
  AcceptState pollAccept(BleLink*& link, HostError& err) override;

  // BleLink
  uint16_t connHandle() const override { return _connHandle; }
  bool isOpen() const override { return _open; }
  bool securityLevel(SecurityLevel& out) const override;
  bool setBondable(bool bondable) override;
  bool confirmPasskey(bool accept) override;
  void forgetPeer(const BondInformation& bond) override;
  bool pollEvent(ConnectionEvent& out) override;
  bool notify(uint16_t handle, const uint8_t* data, size_t len) override;
  void disconnect() override;

  // GattResponder (loop task)
  AttError respond(uint32_t token, AttError code) override;

private:
  struct RawEvent {
    ConnectionEvent::Type type;
    uint8_t  reason;
    uint32_t passkey;
    SecurityLevel level;
    bool     hasBond;
    BondInformation bond;
    int      error;
    int      code;
    uint32_t token;  // Gatt
  };

  // The one outstanding ATT transaction (ATT is strictly request/response).
  struct PendingAccess {
    bool     waiting = false;
    uint32_t token   = 0;
    GattOp   op      = GattOp::Read;
    uint16_t handle  = 0;
    uint8_t  data[GattRequest::kMaxWriteLen] = {};
    size_t   len     = 0;
    AttError verdict = AttError::UnlikelyError;
    uint8_t  readBuf[GattAttribute::kMaxLen] = {};
    size_t   readLen = 0;
  };

  static int gapEventThunk(ble_gap_event* event, void* arg);
  static int accessThunk(uint16_t connHandle, uint16_t attrHandle,
                         ble_gatt_access_ctxt* ctxt, void* arg);
  static void registerThunk(ble_gatt_register_ctxt* ctxt, void* arg);

  int handleGapEvent(ble_gap_event* event);
  int handleAccess(uint16_t connHandle, uint16_t attrHandle, ble_gatt_access_ctxt* ctxt);
  void handleRegister(ble_gatt_register_ctxt* ctxt);

  bool registerServices();
  void post(const RawEvent& ev);
  void postSimple(ConnectionEvent::Type type, int code = 0);
  void postPairing(uint16_t connHandle, int status);

  enum class Accept : uint8_t { Idle, Pending, Connected, Failed };

  GattTable* _table = nullptr;
  QueueHandle_t     _events   = nullptr;
  SemaphoreHandle_t _replySem = nullptr;
  portMUX_TYPE      _mux      = portMUX_INITIALIZER_UNLOCKED;
  PendingAccess     _pending;
  SubscriptionTracker _subscriptions;  // guarded by _mux
  uint32_t          _nextToken = 0;

  uint8_t           _ownAddrType = 0;
  volatile uint16_t _connHandle  = 0xFFFF;
  volatile bool     _open        = false;
  volatile bool     _lostDisconnect = false;
  volatile uint8_t  _lostReason  = 0;
  volatile Accept   _accept      = Accept::Idle;
  volatile HostError _acceptErr  = HostError::None;

  // GATT definitions handed to NimBLE; must outlive the server.
  static constexpr size_t kSvcCount = GattTable::kServiceCount;
  static constexpr size_t kChrCount = GattTable::kAttrCount;
  static constexpr size_t kDscCount = GattAttribute::kMaxDescriptors;

  ble_uuid_any_t   _svcUuid[kSvcCount];
  ble_uuid_any_t   _chrUuid[kChrCount];
  ble_uuid_any_t   _dscUuid[kChrCount][kDscCount];
  ble_gatt_dsc_def _dscDefs[kChrCount][kDscCount + 1];
  ble_gatt_chr_def _chrDefs[kSvcCount][kChrCount + 1];
  AttrId           _chrIds[kSvcCount][kChrCount + 1];
  ble_gatt_svc_def _svcDefs[kSvcCount + 1];
};
