#pragma once
#include "hid/KeyState.hpp"
#include "util/BoundedQueue.hpp"

// Knob -> HID hand-off. Depth covers a fast spin during one press/release gap.
using KeyQueue = BoundedQueue<KeyState, 8>;
