#pragma once
#include <stdint.h>

class BleLink;

// A unit of per-connection work driven cooperatively from loop(). cancel()
// may be called at any tick boundary and must leave no partial state behind.
class SessionTask {
public:
  virtual ~SessionTask() = default;

  virtual void begin(BleLink& link, uint32_t nowMs) = 0;
  // Returns true once the task has run to completion.
  virtual bool tick(uint32_t nowMs) = 0;
  virtual void cancel() = 0;
};
