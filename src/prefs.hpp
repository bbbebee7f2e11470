#pragma once
#include <Preferences.h>

#include "config/KnobConfig.hpp"

extern Preferences prefs;

static constexpr const char* NVS_NS          = "knob";
static constexpr const char* KEY_NAME        = "name";
static constexpr const char* KEY_DEBOUNCE_US = "debounce";
static constexpr const char* KEY_RELEASE_MS  = "release";
static constexpr const char* KEY_STATUS_MS   = "status";
static constexpr const char* KEY_RETRY_MS    = "retry";
static constexpr const char* KEY_REVERSED    = "reverse";
static constexpr const char* KEY_DEMO        = "demo";
#define KEY_FW_VER       "fw_ver"

#ifndef FW_VERSION
#define FW_VERSION "unknown"
#endif

// Missing keys keep the compile-time defaults; the result is always sanitized.
inline void loadKnobConfig(Preferences& p, KnobConfig& cfg) {
	char name[KnobConfig::kNameCap + 1] = {};
	if (p.getString(KEY_NAME, name, sizeof(name)) > 0) {
		cfg.setName(name);
	}
	cfg.debounceUs       = p.getUInt(KEY_DEBOUNCE_US, cfg.debounceUs);
	cfg.releaseDelayMs   = p.getUInt(KEY_RELEASE_MS, cfg.releaseDelayMs);
	cfg.statusIntervalMs = p.getUInt(KEY_STATUS_MS, cfg.statusIntervalMs);
	cfg.advertiseRetryMs = p.getUInt(KEY_RETRY_MS, cfg.advertiseRetryMs);
	cfg.reversed         = p.getBool(KEY_REVERSED, cfg.reversed);
	cfg.demoMode         = p.getBool(KEY_DEMO, cfg.demoMode);
	cfg.sanitize();
}

inline bool saveKnobConfig(Preferences& p, const KnobConfig& cfg) {
	bool ok = p.putString(KEY_NAME, cfg.deviceName) > 0;
	ok = p.putUInt(KEY_DEBOUNCE_US, cfg.debounceUs) > 0 && ok;
	ok = p.putUInt(KEY_RELEASE_MS, cfg.releaseDelayMs) > 0 && ok;
	ok = p.putUInt(KEY_STATUS_MS, cfg.statusIntervalMs) > 0 && ok;
	ok = p.putUInt(KEY_RETRY_MS, cfg.advertiseRetryMs) > 0 && ok;
	ok = p.putBool(KEY_REVERSED, cfg.reversed) > 0 && ok;
	ok = p.putBool(KEY_DEMO, cfg.demoMode) > 0 && ok;
	return ok;
}
