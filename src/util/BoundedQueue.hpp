// File Overview: Fixed-capacity FIFO used to hand knob events from the input
// poller to the HID notifier without heap allocation.
#pragma once
#include <stddef.h>

template <typename T, size_t N>
class BoundedQueue {
public:
  static_assert(N > 0, "BoundedQueue needs room for at least one element");

  // Returns false (and drops the value) when the queue is full.
  bool push(const T& value) {
    if (_count == N) return false;
    _items[(_head + _count) % N] = value;
    ++_count;
    return true;
  }

  bool pop(T& out) {
    if (_count == 0) return false;
    out = _items[_head];
    _head = (_head + 1) % N;
    --_count;
    return true;
  }

  void clear() { _head = 0; _count = 0; }

  size_t size() const { return _count; }
  bool empty() const { return _count == 0; }
  bool full() const { return _count == N; }
  static constexpr size_t capacity() { return N; }

private:
  T      _items[N]{};
  size_t _head  = 0;
  size_t _count = 0;
};
