#include "ble/GattRequest.hpp"

#include <string.h>

GattRequest::GattRequest(GattOp op, uint16_t handle, GattResponder* responder, uint32_t token,
                         const uint8_t* data, size_t len)
    : _op(op), _handle(handle), _responder(responder), _token(token) {
  if (data && len) {
    _len = len > kMaxWriteLen ? kMaxWriteLen : len;
    memcpy(_data, data, _len);
  }
}

GattRequest::GattRequest(GattRequest&& other) noexcept
    : _op(other._op), _handle(other._handle), _responder(other._responder),
      _token(other._token), _len(other._len) {
  memcpy(_data, other._data, _len);
  other._responder = nullptr;
}

GattRequest& GattRequest::operator=(GattRequest&& other) noexcept {
  if (this != &other) {
    release();
    _op        = other._op;
    _handle    = other._handle;
    _responder = other._responder;
    _token     = other._token;
    _len       = other._len;
    memcpy(_data, other._data, _len);
    other._responder = nullptr;
  }
  return *this;
}

GattRequest::~GattRequest() {
  release();
}

void GattRequest::release() {
  if (_responder) {
    reply(AttError::UnlikelyError);
  }
}

AttError GattRequest::reply(AttError code) {
  if (!_responder) {
    // already answered
    return AttError::UnlikelyError;
  }
  GattResponder* responder = _responder;
  _responder = nullptr;
  return responder->respond(_token, code);
}
