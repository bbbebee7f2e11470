// File Overview: Consumer-control key states and the fixed HID input report /
// report map the knob exposes over the HID service.
#pragma once
#include <stddef.h>
#include <stdint.h>

enum class KeyState : uint8_t { None, VolUp, VolDown, Mute };

// Leading byte of every input report. The report map declares it as a
// constant field, so hosts ignore it.
constexpr uint8_t kHidInputReportId = 0x01;
// Report Reference descriptor: report ID 0 (map has no IDs), type Input.
constexpr uint8_t kHidReportTypeInput = 0x01;

constexpr size_t kHidInputReportLen = 2;

struct InputReport {
  uint8_t bytes[kHidInputReportLen];
};

// Pure mapping: VolUp=0b001, VolDown=0b010, Mute=0b100, None=0.
InputReport asReport(KeyState key);

const char* keyName(KeyState key);

extern const uint8_t kHidReportMap[];
extern const size_t  kHidReportMapLen;
