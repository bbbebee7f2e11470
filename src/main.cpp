#include <Arduino.h>
#include <Preferences.h>
#include <string.h>

#include "esp_log.h"
#include "esp_system.h"

#include "pins.hpp"
#include "prefs.hpp"
#include "ble/GattTable.hpp"
#include "ble/KnobBleService.hpp"
#include "ble/NimBleHost.hpp"
#include "ble/SessionCallbacks.hpp"
#include "config/ConfigConsole.hpp"
#include "config/KnobConfig.hpp"
#include "hid/KeyQueue.hpp"
#include "input/KnobInput.hpp"
#include "input/KnobInputHal_Arduino.hpp"
#include "power/BatteryGauge.hpp"

// ---------------- Globals ----------------
Preferences prefs;
static KnobConfig cfg;
static GattTable gattTable;
static KeyQueue keys;
static NimBleHost bleHost;
static SessionCallbacks callbacks;
static KnobBleService service(bleHost, gattTable, keys, callbacks);
static KnobInputHal_Arduino knobHal(PIN_ENC_A, PIN_ENC_B, PIN_ENC_BUTTON);
static KnobInput knobInput(knobHal, keys);
static ConfigConsole console;
static BatteryGauge gauge;

static const char* kTag   = "KNOB";
static const char* kBleTag = "KNOB-BLE";
static const char* kInTag  = "KNOB-IN";
static constexpr uint32_t kBatterySampleMs = 5000;
static constexpr uint32_t kRestartDelayMs  = 2000;

static const char* opName(GattOp op) { return op == GattOp::Write ? "write" : "read"; }

static const char* sessionEndName(SessionEnd end) {
  switch (end) {
    case SessionEnd::Disconnected:    return "disconnected";
    case SessionEnd::NotifierStopped: return "notifier stopped";
    case SessionEnd::Aborted:         return "aborted";
    default:                          return "none";
  }
}

static void wireCallbacks() {
  callbacks.onAdvertising = [](const char* name) {
    ESP_LOGI(kBleTag, "Advertising as \"%s\"", name);
  };
  callbacks.onAdvertiseFailed = [](HostError err) {
    if (hostErrorIsTransient(err)) {
      ESP_LOGI(kBleTag, "Previous link still closing, advertising in %lu ms",
               (unsigned long)cfg.advertiseRetryMs);
      return;
    }
    ESP_LOGE(kBleTag, "Advertising failed: %s (retry in %lu ms)",
             hostErrorName(err), (unsigned long)cfg.advertiseRetryMs);
  };
  callbacks.onConnected = [](uint16_t conn) {
    ESP_LOGI(kBleTag, "Session started (conn=%u, bond held=%d)", conn, service.bonds().hasBond());
  };
  callbacks.onPasskeyDisplay = [](uint32_t passkey) {
    ESP_LOGI(kBleTag, "Passkey: %06lu", (unsigned long)passkey);
  };
  callbacks.onPasskeyConfirm = [](uint32_t passkey) {
    ESP_LOGI(kBleTag, "Confirming numeric comparison %06lu", (unsigned long)passkey);
  };
  callbacks.onPasskeyInput = []() {
    ESP_LOGW(kBleTag, "Peer asked for passkey input; knob has no keypad");
  };
  callbacks.onPairingComplete = [](SecurityLevel level, const BondInformation* bond) {
    if (!bond) {
      ESP_LOGI(kBleTag, "Pairing complete: %s, not bonded", securityLevelName(level));
      return;
    }
    ESP_LOGI(kBleTag, "Pairing complete: %s, bonded to %02x:%02x:%02x:%02x:%02x:%02x (type %u, key %u bytes)",
             securityLevelName(level), bond->addr[5], bond->addr[4], bond->addr[3],
             bond->addr[2], bond->addr[1], bond->addr[0], bond->addrType, bond->keySize);
  };
  callbacks.onPairingFailed = [](int error) {
    ESP_LOGW(kBleTag, "Pairing failed (err=%d)", error);
  };
  callbacks.onGattAccess = [](GattOp op, uint16_t handle, const char* name, AttError reply) {
    if (reply == AttError::None) {
      ESP_LOGD(kBleTag, "GATT %s %s (0x%04x) ok", opName(op), name, handle);
    } else {
      ESP_LOGW(kBleTag, "GATT %s %s (0x%04x) rejected att=0x%02x",
               opName(op), name, handle, (unsigned)reply);
    }
  };
  callbacks.onDisconnected = [](uint8_t reason) {
    ESP_LOGI(kBleTag, "Central disconnected (reason=0x%02x)", reason);
  };
  callbacks.onSessionEnded = [](SessionEnd end) {
    ESP_LOGI(kBleTag, "Session ended: %s", sessionEndName(end));
  };
  callbacks.onKeySent = [](KeyState key) {
    ESP_LOGD(kInTag, "Sent %s", keyName(key));
  };
  callbacks.onNotifyFailed = [](uint16_t handle) {
    ESP_LOGW(kBleTag, "Notification on handle 0x%04x failed", handle);
  };
}

static void applyRuntimeConfig() {
  KnobInput::Config in;
  in.debounceUs = cfg.debounceUs;
  in.reversed   = cfg.reversed;
  knobInput.begin(in);

  service.setReleaseDelay(cfg.releaseDelayMs);
  service.setStatusInterval(cfg.statusIntervalMs);
  service.setRetryDelay(cfg.advertiseRetryMs);
  service.setDemoMode(cfg.demoMode);
}

static void printConfig() {
  Serial.printf("name=%s\n", cfg.deviceName);
  Serial.printf("debounce=%lu us\n", (unsigned long)cfg.debounceUs);
  Serial.printf("release=%lu ms\n", (unsigned long)cfg.releaseDelayMs);
  Serial.printf("status=%lu ms\n", (unsigned long)cfg.statusIntervalMs);
  Serial.printf("retry=%lu ms\n", (unsigned long)cfg.advertiseRetryMs);
  Serial.printf("reverse=%d demo=%d\n", cfg.reversed, cfg.demoMode);
  Serial.printf("bond=%s connected=%d battery=%u%%\n",
                service.bonds().hasBond() ? "held" : "none", service.isConnected(), gauge.percent());
}

static void handleConsoleLine(const char* line) {
  switch (console.execute(line, cfg)) {
    case ConfigConsole::Result::Empty:
      break;
    case ConfigConsole::Result::Updated:
      if (!saveKnobConfig(prefs, cfg)) {
        ESP_LOGW(kTag, "Saving settings to NVS failed");
      }
      applyRuntimeConfig();
      Serial.printf("[CFG] %s updated%s\n", console.key(),
                    strcmp(console.key(), "name") == 0 ? " (applies after reboot)" : "");
      break;
    case ConfigConsole::Result::Show:
      printConfig();
      break;
    case ConfigConsole::Result::Forget:
      service.forgetBond();
      bleHost.forgetAllBonds();
      // the bonded central may be the one connected; make it pair again
      service.restart(millis());
      Serial.println("[CFG] Bond forgotten, advertising again");
      break;
    case ConfigConsole::Result::Help:
      Serial.print(ConfigConsole::helpText());
      break;
    case ConfigConsole::Result::UnknownCommand:
      Serial.println("[CFG] Unknown command (try 'help')");
      break;
    case ConfigConsole::Result::UnknownKey:
      Serial.printf("[CFG] Unknown setting '%s'\n", console.key());
      break;
    case ConfigConsole::Result::BadValue:
      Serial.printf("[CFG] Bad value for '%s'\n", console.key());
      break;
  }
}

static void sampleBattery(uint32_t now) {
  static uint32_t lastMs = 0;
  static bool first = true;
  if (!first && now - lastMs < kBatterySampleMs) return;
  first = false;
  lastMs = now;
  if (PIN_BATT_SENSE < 0) return;

  const uint32_t mv = analogReadMilliVolts(PIN_BATT_SENSE) * BATT_DIVIDER;
  const uint8_t pct = gauge.update(mv);
  if (!gattTable.setByte(AttrId::BatteryLevel, pct)) {
    ESP_LOGW(kTag, "Battery level not stored");
  }
}

void setup() {
  Serial.begin(115200);
  delay(50);
  Serial.println();
  Serial.printf("[BOOT] Volume knob fw %s\n", FW_VERSION);

  // prefs first
  if (!prefs.begin(NVS_NS, false)) {
    ESP_LOGW(kTag, "NVS namespace '%s' unavailable, using defaults", NVS_NS);
  }
  loadKnobConfig(prefs, cfg);
  if (prefs.getString(KEY_FW_VER, "") != FW_VERSION && prefs.putString(KEY_FW_VER, FW_VERSION) == 0) {
    ESP_LOGW(kTag, "Could not record firmware version");
  }

  gattTable.build(GattTable::Identity{});
  wireCallbacks();

  if (!bleHost.begin(cfg.deviceName, gattTable)) {
    ESP_LOGE(kBleTag, "BLE host init failed, restarting");
    delay(kRestartDelayMs);
    esp_restart();
  }
  Serial.println("[BLE] GATT services registered");

  applyRuntimeConfig();
  sampleBattery(millis());
  service.begin(cfg.deviceName, millis());
  Serial.println("[BLE] Advertising started");
  ESP_LOGI(kTag, "Ready (reverse=%d demo=%d)", cfg.reversed, cfg.demoMode);
}

void loop() {
  knobInput.poll();

  const uint32_t now = millis();
  sampleBattery(now);
  service.tick(now);

  while (Serial.available() > 0) {
    if (console.feed((char)Serial.read())) {
      handleConsoleLine(console.line());
    }
  }

  static uint32_t lastDropped = 0;
  if (knobInput.droppedKeys() != lastDropped) {
    ESP_LOGW(kInTag, "Key queue full, %lu keys dropped",
             (unsigned long)(knobInput.droppedKeys() - lastDropped));
    lastDropped = knobInput.droppedKeys();
  }

  delay(1);
}
