// File Overview: Line-oriented serial console for inspecting and changing the
// persisted knob settings ("show", "set <key> <value>", "forget", "help").
#pragma once
#include <stddef.h>
#include <stdint.h>

#include "config/KnobConfig.hpp"

class ConfigConsole {
public:
  enum class Result : uint8_t {
    Empty,
    Updated,    // cfg changed; key() names the setting
    Show,
    Forget,
    Help,
    UnknownCommand,
    UnknownKey,
    BadValue,
  };

  static constexpr size_t kLineCap = 64;

  // Accumulates serial bytes; returns true when a complete line is ready in
  // line(). CR, LF or CRLF terminate; overlong lines are discarded.
  bool feed(char c);
  const char* line() const { return _line; }

  // Parses one line and applies "set" commands to cfg (sanitized).
  Result execute(const char* line, KnobConfig& cfg);

  // Setting touched by the last Updated/BadValue result.
  const char* key() const { return _key; }

  static const char* helpText();

private:
  char   _buf[kLineCap + 1] = {};
  char   _line[kLineCap + 1] = {};
  size_t _len = 0;
  bool   _overflow = false;
  char   _key[16] = {};
};
