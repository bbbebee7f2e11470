// File Overview: A single ATT read or write surfaced by the host, carrying the
// obligation to answer it exactly once.
#pragma once
#include <stddef.h>
#include <stdint.h>

#include "ble/BleTypes.hpp"

enum class GattOp : uint8_t { Read, Write };

// Implemented by whoever owns the pending ATT transaction (the NimBLE adapter
// on the device, a fake in tests). The token identifies the transaction so a
// stale reply after a timeout or disconnect is recognised and dropped.
// Returns the code actually sent, which may differ from the requested one
// (for example when an accepted write has the wrong length).
class GattResponder {
public:
  virtual ~GattResponder() = default;
  virtual AttError respond(uint32_t token, AttError code) = 0;
};

// Move-only. accept()/reject() send the reply; a request destroyed without a
// reply answers UnlikelyError so the peer is never left waiting.
class GattRequest {
public:
  static constexpr size_t kMaxWriteLen = 20;

  GattRequest() = default;
  GattRequest(GattOp op, uint16_t handle, GattResponder* responder, uint32_t token,
              const uint8_t* data = nullptr, size_t len = 0);
  GattRequest(GattRequest&& other) noexcept;
  GattRequest& operator=(GattRequest&& other) noexcept;
  GattRequest(const GattRequest&) = delete;
  GattRequest& operator=(const GattRequest&) = delete;
  ~GattRequest();

  GattOp op() const { return _op; }
  uint16_t handle() const { return _handle; }
  const uint8_t* data() const { return _data; }
  size_t size() const { return _len; }
  bool pending() const { return _responder != nullptr; }

  AttError accept() { return reply(AttError::None); }
  AttError reject(AttError code) { return reply(code); }

private:
  AttError reply(AttError code);
  void release();

  GattOp         _op        = GattOp::Read;
  uint16_t       _handle    = 0;
  GattResponder* _responder = nullptr;
  uint32_t       _token     = 0;
  uint8_t        _data[kMaxWriteLen] = {};
  size_t         _len       = 0;
};
