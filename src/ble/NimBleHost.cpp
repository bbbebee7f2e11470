#include "ble/NimBleHost.hpp"

#include <esp_log.h>
#include <esp_system.h>

#include <string.h>

extern "C" {
  #include "services/gap/ble_svc_gap.h"
  #include "services/gatt/ble_svc_gatt.h"
}

namespace {
const char* kBleLogTag = "KNOB-BLE";
constexpr uint16_t kNoConn = BLE_HS_CONN_HANDLE_NONE;
constexpr uint32_t kSyncWaitMs = 2000;

uint8_t flagsForCaps(uint8_t caps) {
  uint8_t flags = 0;
  if (caps & kCapRead)       flags |= BLE_GATT_CHR_F_READ;
  if (caps & kCapWrite)      flags |= BLE_GATT_CHR_F_WRITE;
  if (caps & kCapWriteNoRsp) flags |= BLE_GATT_CHR_F_WRITE_NO_RSP;
  if (caps & kCapNotify)     flags |= BLE_GATT_CHR_F_NOTIFY;
  return flags;
}

SecurityLevel levelFromDesc(const ble_gap_conn_desc& desc) {
  if (!desc.sec_state.encrypted) return SecurityLevel::NoEncryption;
  return desc.sec_state.authenticated ? SecurityLevel::EncryptedAuthenticated
                                      : SecurityLevel::Encrypted;
}

bool initUuid(ble_uuid_any_t& out, const GattUuid& uuid) {
  return ble_uuid_init_from_buf(&out, uuid.bytes, uuid.len) == 0;
}
}  // namespace

bool NimBleHost::begin(const char* deviceName, GattTable& table) {
  _table = &table;

  _events   = xQueueCreate(kEventQueueDepth, sizeof(RawEvent));
  _replySem = xSemaphoreCreateBinary();
  if (!_events || !_replySem) {
    ESP_LOGE(kBleLogTag, "Failed to allocate host queue/semaphore");
    return false;
  }

  NimBLEDevice::init(deviceName);
  Serial.println("[BLE] NimBLE initialized");

  NimBLEDevice::setPower(ESP_PWR_LVL_P9, ESP_BLE_PWR_TYPE_DEFAULT);
  NimBLEDevice::setPower(ESP_PWR_LVL_P9, ESP_BLE_PWR_TYPE_ADV);
  // Bonding, MITM, secure connections. Bonding is re-decided per session.
  NimBLEDevice::setSecurityAuth(true, true, true);
  NimBLEDevice::setSecurityIOCap(BLE_HS_IO_DISPLAY_YESNO);

  // Bonds live in RAM only; start every boot with an empty store.
  forgetAllBonds();

  const uint32_t start = millis();
  while (!ble_hs_synced()) {
    if (millis() - start > kSyncWaitMs) {
      ESP_LOGE(kBleLogTag, "Host did not sync within %lu ms", (unsigned long)kSyncWaitMs);
      return false;
    }
    delay(10);
  }

  int rc = ble_hs_id_infer_auto(0, &_ownAddrType);
  if (rc != 0) {
    ESP_LOGE(kBleLogTag, "ble_hs_id_infer_auto failed rc=%d", rc);
    return false;
  }

  if (!registerServices()) {
    return false;
  }

  rc = ble_svc_gap_device_name_set(deviceName);
  if (rc != 0) {
    ESP_LOGW(kBleLogTag, "GAP device name not set rc=%d", rc);
  }
  rc = ble_svc_gap_device_appearance_set(kAppearanceHidKeyboard);
  if (rc != 0) {
    ESP_LOGW(kBleLogTag, "GAP appearance not set rc=%d", rc);
  }

  ESP_LOGI(kBleLogTag, "BLE host ready (name=%s)", deviceName);
  return true;
}

void NimBleHost::forgetAllBonds() {
  if (!NimBLEDevice::deleteAllBonds()) {
    ESP_LOGW(kBleLogTag, "Bond store could not be cleared");
  }
}

// Builds NimBLE service/characteristic/descriptor definitions from the table,
// registers them, and rebinds the table to the handles NimBLE assigned.
bool NimBleHost::registerServices() {
  memset(_svcDefs, 0, sizeof(_svcDefs));
  memset(_chrDefs, 0, sizeof(_chrDefs));
  memset(_dscDefs, 0, sizeof(_dscDefs));

  for (size_t s = 0; s < kSvcCount; ++s) {
    const ServiceId svc = (ServiceId)s;
    if (!initUuid(_svcUuid[s], GattTable::serviceUuid(svc))) {
      ESP_LOGE(kBleLogTag, "Bad UUID for service %s", GattTable::serviceName(svc));
      return false;
    }

    size_t c = 0;
    for (size_t a = 0; a < kChrCount; ++a) {
      const GattAttribute& attr = _table->at((AttrId)a);
      if (attr.service != svc) continue;

      if (!initUuid(_chrUuid[a], attr.uuid)) {
        ESP_LOGE(kBleLogTag, "Bad UUID for %s", attr.name);
        return false;
      }
      for (uint8_t d = 0; d < attr.descriptorCount; ++d) {
        if (!initUuid(_dscUuid[a][d], attr.descriptors[d].uuid)) {
          ESP_LOGE(kBleLogTag, "Bad descriptor UUID for %s", attr.name);
          return false;
        }
        ble_gatt_dsc_def& dsc = _dscDefs[a][d];
        dsc.uuid      = &_dscUuid[a][d].u;
        dsc.att_flags = BLE_ATT_F_READ;
        dsc.access_cb = accessThunk;
        dsc.arg       = this;
      }

      ble_gatt_chr_def& chr = _chrDefs[s][c];
      chr.uuid        = &_chrUuid[a].u;
      chr.access_cb   = accessThunk;
      chr.arg         = this;
      chr.descriptors = attr.descriptorCount ? _dscDefs[a] : nullptr;
      chr.flags       = flagsForCaps(attr.caps);
      _chrIds[s][c]   = attr.id;
      ++c;
    }

    _svcDefs[s].type            = BLE_GATT_SVC_TYPE_PRIMARY;
    _svcDefs[s].uuid            = &_svcUuid[s].u;
    _svcDefs[s].characteristics = _chrDefs[s];
  }

  int rc = ble_gatts_reset();
  if (rc != 0) {
    ESP_LOGE(kBleLogTag, "ble_gatts_reset failed rc=%d", rc);
    return false;
  }
  ble_svc_gap_init();
  ble_svc_gatt_init();

  rc = ble_gatts_count_cfg(_svcDefs);
  if (rc != 0) {
    ESP_LOGE(kBleLogTag, "ble_gatts_count_cfg failed rc=%d", rc);
    return false;
  }
  rc = ble_gatts_add_svcs(_svcDefs);
  if (rc != 0) {
    ESP_LOGE(kBleLogTag, "ble_gatts_add_svcs failed rc=%d", rc);
    return false;
  }

  ble_hs_cfg.gatts_register_cb  = registerThunk;
  ble_hs_cfg.gatts_register_arg = this;
  rc = ble_gatts_start();
  if (rc != 0) {
    ESP_LOGE(kBleLogTag, "ble_gatts_start failed rc=%d", rc);
    return false;
  }
  return true;
}

void NimBleHost::registerThunk(ble_gatt_register_ctxt* ctxt, void* arg) {
  static_cast<NimBleHost*>(arg)->handleRegister(ctxt);
}

void NimBleHost::handleRegister(ble_gatt_register_ctxt* ctxt) {
  switch (ctxt->op) {
    case BLE_GATT_REGISTER_OP_CHR:
      for (size_t s = 0; s < kSvcCount; ++s) {
        for (size_t c = 0; _chrDefs[s][c].uuid; ++c) {
          if (ctxt->chr.chr_def != &_chrDefs[s][c]) continue;
          _table->bindHandle(_chrIds[s][c], ctxt->chr.val_handle);
          ESP_LOGD(kBleLogTag, "%s -> handle %u",
                   _table->at(_chrIds[s][c]).name, ctxt->chr.val_handle);
        }
      }
      break;

    case BLE_GATT_REGISTER_OP_DSC:
      for (size_t a = 0; a < kChrCount; ++a) {
        for (size_t d = 0; d < kDscCount; ++d) {
          if (ctxt->dsc.dsc_def != &_dscDefs[a][d]) continue;
          _table->bindDescriptorHandle((AttrId)a, (uint8_t)d, ctxt->dsc.handle);
        }
      }
      break;

    default:
      break;
  }
}

bool NimBleHost::startAdvertising(const uint8_t* advData, size_t len, HostError& err) {
  if (_open) {
    disconnect();
    const uint32_t start = millis();
    while (_open && millis() - start < kTeardownWaitMs) {
      delay(10);
    }
  }
  if (_open) {
    // Still closing; the back-off retries.
    err = HostError::Disconnect;
    return false;
  }

  xQueueReset(_events);
  _lostDisconnect = false;
  _acceptErr = HostError::None;

  int rc = ble_gap_adv_set_data(advData, (int)len);
  if (rc != 0) {
    ESP_LOGE(kBleLogTag, "ble_gap_adv_set_data failed rc=%d", rc);
    err = HostError::AdvertisingData;
    return false;
  }

  ble_gap_adv_params params;
  memset(&params, 0, sizeof(params));
  params.conn_mode = BLE_GAP_CONN_MODE_UND;
  params.disc_mode = BLE_GAP_DISC_MODE_GEN;
  params.itvl_min  = 0x0020;  // 20 ms
  params.itvl_max  = 0x0040;  // 40 ms

  _accept = Accept::Pending;
  rc = ble_gap_adv_start(_ownAddrType, nullptr, BLE_HS_FOREVER, &params, gapEventThunk, this);
  if (rc != 0) {
    _accept = Accept::Idle;
    ESP_LOGE(kBleLogTag, "ble_gap_adv_start failed rc=%d", rc);
    err = HostError::AdvertisingStart;
    return false;
  }
  return true;
}

void NimBleHost::stopAdvertising() {
  _accept = Accept::Idle;
  if (ble_gap_adv_active()) {
    int rc = ble_gap_adv_stop();
    if (rc != 0 && rc != BLE_HS_EALREADY) {
      ESP_LOGW(kBleLogTag, "ble_gap_adv_stop failed rc=%d", rc);
    }
  }
}

BlePeripheral::AcceptState NimBleHost::pollAccept(BleLink*& link, HostError& err) {
  switch (_accept) {
    case Accept::Connected:
      _accept = Accept::Idle;
      link = this;
      return AcceptState::Connected;

    case Accept::Failed:
      _accept = Accept::Idle;
      err = _acceptErr;
      return AcceptState::Failed;

    case Accept::Pending:
      if (!ble_hs_synced()) {
        _accept = Accept::Idle;
        err = HostError::HostReset;
        return AcceptState::Failed;
      }
      return AcceptState::Pending;

    case Accept::Idle:
      break;
  }
  err = HostError::Accept;
  return AcceptState::Failed;
}

bool NimBleHost::securityLevel(SecurityLevel& out) const {
  if (!_open) return false;
  ble_gap_conn_desc desc;
  if (ble_gap_conn_find(_connHandle, &desc) != 0) return false;
  out = levelFromDesc(desc);
  return true;
}

bool NimBleHost::setBondable(bool bondable) {
  if (!_open) return false;
  NimBLEDevice::setSecurityAuth(bondable, true, true);
  ESP_LOGI(kBleLogTag, "Bonding %s for this session", bondable ? "allowed" : "refused");
  return true;
}

bool NimBleHost::confirmPasskey(bool accept) {
  if (!_open) return false;
  ble_sm_io io;
  memset(&io, 0, sizeof(io));
  io.action = BLE_SM_IOACT_NUMCMP;
  io.numcmp_accept = accept ? 1 : 0;
  int rc = ble_sm_inject_io(_connHandle, &io);
  if (rc != 0) {
    ESP_LOGW(kBleLogTag, "Numeric comparison reply failed rc=%d", rc);
    return false;
  }
  return true;
}

void NimBleHost::forgetPeer(const BondInformation& bond) {
  ble_addr_t addr;
  addr.type = bond.addrType;
  memcpy(addr.val, bond.addr, sizeof(addr.val));
  int rc = ble_store_util_delete_peer(&addr);
  if (rc != 0 && rc != BLE_HS_ENOENT) {
    ESP_LOGW(kBleLogTag, "Could not delete stored keys rc=%d", rc);
  }
}

bool NimBleHost::pollEvent(ConnectionEvent& out) {
  RawEvent raw;
  while (xQueueReceive(_events, &raw, 0) == pdTRUE) {
    out.type    = raw.type;
    out.reason  = raw.reason;
    out.passkey = raw.passkey;
    out.level   = raw.level;
    out.hasBond = raw.hasBond;
    out.bond    = raw.bond;
    out.error   = raw.error;
    out.code    = raw.code;
    if (raw.type != ConnectionEvent::Type::Gatt) {
      return true;
    }

    bool live = false;
    portENTER_CRITICAL(&_mux);
    if (_pending.waiting && _pending.token == raw.token) {
      out.request = GattRequest(_pending.op, _pending.handle, this, _pending.token,
                                _pending.data, _pending.len);
      live = true;
    }
    portEXIT_CRITICAL(&_mux);
    if (live) return true;
    // The host already timed the transaction out; nothing left to answer.
  }

  if (_lostDisconnect && !_open) {
    _lostDisconnect = false;
    out.type   = ConnectionEvent::Type::Disconnected;
    out.reason = _lostReason;
    return true;
  }
  return false;
}

bool NimBleHost::notify(uint16_t handle, const uint8_t* data, size_t len) {
  if (!_open) return false;

  portENTER_CRITICAL(&_mux);
  const bool wanted = _subscriptions.subscribed(handle);
  portEXIT_CRITICAL(&_mux);
  if (!wanted) {
    ESP_LOGV(kBleLogTag, "Handle %u not subscribed, notify skipped", handle);
    return true;
  }
  // Same gate as reads: nothing leaves before the link is authenticated.
  SecurityLevel level = SecurityLevel::NoEncryption;
  if (!securityLevel(level)) return false;
  if (!isAuthenticated(level)) {
    ESP_LOGV(kBleLogTag, "Link not authenticated, notify on handle %u skipped", handle);
    return true;
  }

  os_mbuf* om = ble_hs_mbuf_from_flat(data, (uint16_t)len);
  if (!om) {
    ESP_LOGW(kBleLogTag, "No mbuf for notify on handle %u", handle);
    return false;
  }
  // Consumes om on success and failure.
  int rc = ble_gattc_notify_custom(_connHandle, handle, om);
  if (rc != 0) {
    ESP_LOGW(kBleLogTag, "Notify on handle %u failed rc=%d", handle, rc);
    return false;
  }
  return true;
}

void NimBleHost::disconnect() {
  if (!_open) return;
  int rc = ble_gap_terminate(_connHandle, BLE_ERR_REM_USER_CONN_TERM);
  if (rc != 0 && rc != BLE_HS_ENOTCONN && rc != BLE_HS_EALREADY) {
    ESP_LOGW(kBleLogTag, "ble_gap_terminate failed rc=%d", rc);
  }
}

AttError NimBleHost::respond(uint32_t token, AttError code) {
  AttError verdict = code;
  portENTER_CRITICAL(&_mux);
  if (!_pending.waiting || _pending.token != token) {
    portEXIT_CRITICAL(&_mux);
    return AttError::UnlikelyError;
  }
  if (code == AttError::None) {
    if (_pending.op == GattOp::Write) {
      verdict = _table->write(_pending.handle, _pending.data, _pending.len);
    } else {
      const uint8_t* value = nullptr;
      size_t len = 0;
      if (_table->read(_pending.handle, value, len) && len <= sizeof(_pending.readBuf)) {
        memcpy(_pending.readBuf, value, len);
        _pending.readLen = len;
      } else {
        verdict = AttError::InvalidHandle;
      }
    }
  }
  _pending.verdict = verdict;
  portEXIT_CRITICAL(&_mux);

  xSemaphoreGive(_replySem);
  return verdict;
}

int NimBleHost::accessThunk(uint16_t connHandle, uint16_t attrHandle,
                            ble_gatt_access_ctxt* ctxt, void* arg) {
  return static_cast<NimBleHost*>(arg)->handleAccess(connHandle, attrHandle, ctxt);
}

// Host task. Parks the ATT transaction in the access slot and blocks until the
// loop() side answers through respond(), or the timeout elapses.
int NimBleHost::handleAccess(uint16_t connHandle, uint16_t attrHandle, ble_gatt_access_ctxt* ctxt) {
  if (connHandle != _connHandle) return BLE_ATT_ERR_UNLIKELY;

  GattOp op = GattOp::Read;
  uint8_t buf[GattRequest::kMaxWriteLen];
  uint16_t len = 0;

  switch (ctxt->op) {
    case BLE_GATT_ACCESS_OP_READ_CHR:
    case BLE_GATT_ACCESS_OP_READ_DSC:
      break;
    case BLE_GATT_ACCESS_OP_WRITE_CHR:
    case BLE_GATT_ACCESS_OP_WRITE_DSC: {
      op = GattOp::Write;
      if (OS_MBUF_PKTLEN(ctxt->om) > sizeof(buf)) return BLE_ATT_ERR_INVALID_ATTR_VALUE_LEN;
      int rc = ble_hs_mbuf_to_flat(ctxt->om, buf, sizeof(buf), &len);
      if (rc != 0) return BLE_ATT_ERR_UNLIKELY;
      break;
    }
    default:
      return BLE_ATT_ERR_UNLIKELY;
  }

  // Drop a give left over from a reply that arrived after its timeout.
  xSemaphoreTake(_replySem, 0);

  RawEvent ev;
  memset(&ev, 0, sizeof(ev));
  ev.type = ConnectionEvent::Type::Gatt;

  portENTER_CRITICAL(&_mux);
  _pending.waiting = true;
  _pending.token   = ++_nextToken;
  _pending.op      = op;
  _pending.handle  = attrHandle;
  _pending.len     = len;
  memcpy(_pending.data, buf, len);
  _pending.verdict = AttError::UnlikelyError;
  _pending.readLen = 0;
  ev.token = _pending.token;
  portEXIT_CRITICAL(&_mux);

  post(ev);

  const bool answered = xSemaphoreTake(_replySem, pdMS_TO_TICKS(kAccessTimeoutMs)) == pdTRUE;

  uint8_t readBuf[GattAttribute::kMaxLen];
  size_t readLen = 0;
  AttError verdict = AttError::UnlikelyError;

  portENTER_CRITICAL(&_mux);
  if (answered) {
    verdict = _pending.verdict;
    readLen = _pending.readLen;
    memcpy(readBuf, _pending.readBuf, readLen);
  }
  _pending.waiting = false;
  portEXIT_CRITICAL(&_mux);

  if (!answered) {
    ESP_LOGW(kBleLogTag, "GATT access on handle %u timed out", attrHandle);
    return BLE_ATT_ERR_UNLIKELY;
  }
  if (verdict != AttError::None) return (int)verdict;
  if (op == GattOp::Read && os_mbuf_append(ctxt->om, readBuf, readLen) != 0) {
    return BLE_ATT_ERR_INSUFFICIENT_RES;
  }
  return 0;
}

void NimBleHost::post(const RawEvent& ev) {
  if (xQueueSend(_events, &ev, 0) == pdTRUE) return;

  if (ev.type == ConnectionEvent::Type::Disconnected) {
    _lostReason     = ev.reason;
    _lostDisconnect = true;
  }
  ESP_LOGW(kBleLogTag, "Event queue full, dropped event %d", (int)ev.type);
}

void NimBleHost::postSimple(ConnectionEvent::Type type, int code) {
  RawEvent ev;
  memset(&ev, 0, sizeof(ev));
  ev.type = type;
  ev.code = code;
  post(ev);
}

void NimBleHost::postPairing(uint16_t connHandle, int status) {
  RawEvent ev;
  memset(&ev, 0, sizeof(ev));

  ble_gap_conn_desc desc;
  if (status != 0 || ble_gap_conn_find(connHandle, &desc) != 0) {
    ev.type  = ConnectionEvent::Type::PairingFailed;
    ev.error = status != 0 ? status : BLE_HS_ENOTCONN;
    post(ev);
    return;
  }

  ev.type    = ConnectionEvent::Type::PairingComplete;
  ev.level   = levelFromDesc(desc);
  ev.hasBond = desc.sec_state.bonded;
  if (ev.hasBond) {
    ev.bond.addrType = desc.peer_id_addr.type;
    memcpy(ev.bond.addr, desc.peer_id_addr.val, sizeof(ev.bond.addr));
    ev.bond.keySize = desc.sec_state.key_size;
  }
  post(ev);
}

int NimBleHost::gapEventThunk(ble_gap_event* event, void* arg) {
  return static_cast<NimBleHost*>(arg)->handleGapEvent(event);
}

// Host task.
int NimBleHost::handleGapEvent(ble_gap_event* event) {
  switch (event->type) {
    case BLE_GAP_EVENT_CONNECT:
      if (event->connect.status == 0) {
        portENTER_CRITICAL(&_mux);
        _subscriptions.clear();
        portEXIT_CRITICAL(&_mux);
        _connHandle = event->connect.conn_handle;
        _open       = true;
        _accept     = Accept::Connected;
        ESP_LOGI(kBleLogTag, "Central connected (conn=%u)", event->connect.conn_handle);
      } else {
        _acceptErr = HostError::Accept;
        _accept    = Accept::Failed;
        ESP_LOGW(kBleLogTag, "Connection attempt failed status=%d", event->connect.status);
      }
      return 0;

    case BLE_GAP_EVENT_DISCONNECT: {
      RawEvent ev;
      memset(&ev, 0, sizeof(ev));
      ev.type   = ConnectionEvent::Type::Disconnected;
      ev.reason = (uint8_t)(event->disconnect.reason & 0xFF);
      post(ev);
      portENTER_CRITICAL(&_mux);
      _subscriptions.clear();
      portEXIT_CRITICAL(&_mux);
      _connHandle = kNoConn;
      _open       = false;
      return 0;
    }

    case BLE_GAP_EVENT_SUBSCRIBE: {
      if (event->subscribe.conn_handle != _connHandle) return 0;
      const uint16_t handle = event->subscribe.attr_handle;
      const bool notify = event->subscribe.cur_notify != 0;
      portENTER_CRITICAL(&_mux);
      const bool stored = _subscriptions.update(handle, notify);
      portEXIT_CRITICAL(&_mux);
      if (!stored) {
        ESP_LOGW(kBleLogTag, "No room to track subscription on handle %u", handle);
      }
      ESP_LOGI(kBleLogTag, "%s notifications %s", _table->nameForHandle(handle),
               notify ? "enabled" : "disabled");
      return 0;
    }

    case BLE_GAP_EVENT_ADV_COMPLETE:
      if (_accept == Accept::Pending && event->adv_complete.reason != 0) {
        _acceptErr = HostError::Accept;
        _accept    = Accept::Failed;
      }
      return 0;

    case BLE_GAP_EVENT_ENC_CHANGE:
      postPairing(event->enc_change.conn_handle, event->enc_change.status);
      return 0;

    case BLE_GAP_EVENT_PASSKEY_ACTION: {
      RawEvent ev;
      memset(&ev, 0, sizeof(ev));
      if (event->passkey.params.action == BLE_SM_IOACT_DISP) {
        ble_sm_io io;
        memset(&io, 0, sizeof(io));
        io.action  = BLE_SM_IOACT_DISP;
        io.passkey = esp_random() % 1000000;
        int rc = ble_sm_inject_io(event->passkey.conn_handle, &io);
        if (rc != 0) {
          ESP_LOGW(kBleLogTag, "Passkey injection failed rc=%d", rc);
        }
        ev.type    = ConnectionEvent::Type::PassKeyDisplay;
        ev.passkey = io.passkey;
      } else if (event->passkey.params.action == BLE_SM_IOACT_NUMCMP) {
        ev.type    = ConnectionEvent::Type::PassKeyConfirm;
        ev.passkey = event->passkey.params.numcmp;
      } else if (event->passkey.params.action == BLE_SM_IOACT_INPUT) {
        ev.type = ConnectionEvent::Type::PassKeyInput;
      } else {
        ev.type = ConnectionEvent::Type::Other;
        ev.code = event->type;
      }
      post(ev);
      return 0;
    }

    case BLE_GAP_EVENT_REPEAT_PAIRING: {
      // Peer lost its keys; drop ours and let it pair again.
      ble_gap_conn_desc desc;
      if (ble_gap_conn_find(event->repeat_pairing.conn_handle, &desc) == 0) {
        int rc = ble_store_util_delete_peer(&desc.peer_id_addr);
        if (rc != 0) {
          ESP_LOGW(kBleLogTag, "Repeat pairing: delete peer failed rc=%d", rc);
        }
      }
      return BLE_GAP_REPEAT_PAIRING_RETRY;
    }

    default:
      if (_open) postSimple(ConnectionEvent::Type::Other, event->type);
      return 0;
  }
}
