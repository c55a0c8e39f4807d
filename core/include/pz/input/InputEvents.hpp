#pragma once
#include <cstdint>
#include <vector>

namespace pz {

enum class PointerDevice : std::uint8_t {
  Touch = 0, Mouse
};

// One finger or the mouse cursor, client pixels, 0=left/top
struct Contact {
  int id{0};
  double x{0}, y{0};
};

// Generic pointer sample. NOT tied to any windowing toolkit.
//   press:   changed = contact that went down, contacts = all down after it
//   move:    contacts = all down contacts with current positions
//   release: changed = contact that went up, contacts = those still down
struct PointerEvent {
  PointerDevice device{PointerDevice::Touch};
  double timeMs{0};
  Contact changed;
  std::vector<Contact> contacts;
};

struct WheelEvent {
  double x{0}, y{0};       // cursor, client pixels
  double deltaY{0};        // negative = scroll up = zoom in
  double timeMs{0};
};

} // namespace pz
