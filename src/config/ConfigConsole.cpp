#include "config/ConfigConsole.hpp"

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

namespace {

const char* skipSpaces(const char* p) {
  while (*p == ' ' || *p == '\t') ++p;
  return p;
}

// Copies the next whitespace-delimited word into out; returns the rest.
const char* nextWord(const char* p, char* out, size_t cap) {
  p = skipSpaces(p);
  size_t n = 0;
  while (*p && *p != ' ' && *p != '\t') {
    if (n + 1 < cap) out[n++] = (char)tolower((unsigned char)*p);
    ++p;
  }
  out[n] = '\0';
  return p;
}

bool parseUnsigned(const char* s, uint32_t& out) {
  if (!s || !*s) return false;
  char* end = nullptr;
  unsigned long v = strtoul(s, &end, 10);
  if (!end || *end != '\0' || *s == '-') return false;
  out = (uint32_t)v;
  return true;
}

bool parseBool(const char* s, bool& out) {
  if (!strcmp(s, "1") || !strcmp(s, "on") || !strcmp(s, "true") || !strcmp(s, "yes")) {
    out = true;
    return true;
  }
  if (!strcmp(s, "0") || !strcmp(s, "off") || !strcmp(s, "false") || !strcmp(s, "no")) {
    out = false;
    return true;
  }
  return false;
}

void trimRight(char* s) {
  size_t n = strlen(s);
  while (n && (s[n - 1] == ' ' || s[n - 1] == '\t')) s[--n] = '\0';
}

}  // namespace

bool ConfigConsole::feed(char c) {
  if (c == '\r' || c == '\n') {
    if (_overflow) {
      _overflow = false;
      _len = 0;
      return false;
    }
    if (_len == 0) return false;  // blank line or LF after CR
    _buf[_len] = '\0';
    memcpy(_line, _buf, _len + 1);
    _len = 0;
    return true;
  }
  if (_overflow) return false;
  if (_len >= kLineCap) {
    _overflow = true;
    return false;
  }
  _buf[_len++] = c;
  return false;
}

ConfigConsole::Result ConfigConsole::execute(const char* line, KnobConfig& cfg) {
  _key[0] = '\0';
  if (!line) return Result::Empty;

  char cmd[12];
  const char* rest = nextWord(line, cmd, sizeof(cmd));
  if (!cmd[0]) return Result::Empty;
  if (!strcmp(cmd, "show"))   return Result::Show;
  if (!strcmp(cmd, "forget")) return Result::Forget;
  if (!strcmp(cmd, "help") || !strcmp(cmd, "?")) return Result::Help;
  if (strcmp(cmd, "set") != 0) return Result::UnknownCommand;

  rest = nextWord(rest, _key, sizeof(_key));
  char value[kLineCap + 1];
  strncpy(value, skipSpaces(rest), kLineCap);
  value[kLineCap] = '\0';
  trimRight(value);

  KnobConfig next = cfg;
  bool ok = false;
  uint32_t n = 0;
  if (!strcmp(_key, "name")) {
    ok = next.setName(value);  // keeps case and spaces
  } else if (!strcmp(_key, "debounce")) {
    ok = parseUnsigned(value, n);
    next.debounceUs = n;
  } else if (!strcmp(_key, "release")) {
    ok = parseUnsigned(value, n);
    next.releaseDelayMs = n;
  } else if (!strcmp(_key, "status")) {
    ok = parseUnsigned(value, n);
    next.statusIntervalMs = n;
  } else if (!strcmp(_key, "retry")) {
    ok = parseUnsigned(value, n);
    next.advertiseRetryMs = n;
  } else if (!strcmp(_key, "reverse")) {
    ok = parseBool(value, next.reversed);
  } else if (!strcmp(_key, "demo")) {
    ok = parseBool(value, next.demoMode);
  } else {
    return Result::UnknownKey;
  }

  if (!ok) return Result::BadValue;
  next.sanitize();
  cfg = next;
  return Result::Updated;
}

const char* ConfigConsole::helpText() {
  return "show | forget | set <name|debounce|release|status|retry|reverse|demo> <value>";
}
