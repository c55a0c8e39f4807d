#pragma once
#include <cstdint>

namespace pz {

// Kind of the one active gesture session (tagged union discriminator).
enum class GestureKind : std::uint8_t {
  None = 0, Pan, Pinch, DoubleTap, Wheel
};

inline const char* toString(GestureKind k) {
  switch (k) {
    case GestureKind::None: return "none";
    case GestureKind::Pan: return "pan";
    case GestureKind::Pinch: return "pinch";
    case GestureKind::DoubleTap: return "doubleTap";
    case GestureKind::Wheel: return "wheel";
    default: return "unknown";
  }
}

enum class GestureEventType : std::uint8_t {
  PanStart = 0, PanMove, PanEnd,
  PinchStart, PinchMove, PinchEnd,
  Tap, DoubleTap, Wheel
};

inline const char* toString(GestureEventType t) {
  switch (t) {
    case GestureEventType::PanStart: return "panStart";
    case GestureEventType::PanMove: return "panMove";
    case GestureEventType::PanEnd: return "panEnd";
    case GestureEventType::PinchStart: return "pinchStart";
    case GestureEventType::PinchMove: return "pinchMove";
    case GestureEventType::PinchEnd: return "pinchEnd";
    case GestureEventType::Tap: return "tap";
    case GestureEventType::DoubleTap: return "doubleTap";
    case GestureEventType::Wheel: return "wheel";
    default: return "unknown";
  }
}

// Classified event, client pixels.
//   Pan*:       x0,y0 = pointer (PanStart: position at press)
//   Pinch*:     x0,y0 / x1,y1 = the two tracked contacts, distance between them
//   Tap/DoubleTap: x0,y0 = release position
//   Wheel:      x0,y0 = cursor, wheelDelta = raw deltaY
struct GestureEvent {
  GestureEventType type{GestureEventType::Tap};
  double x0{0}, y0{0};
  double x1{0}, y1{0};
  double distance{0};
  double wheelDelta{0};
  double timeMs{0};
  bool fromMouse{false};   // mouse drags are kept aligned on every move
};

// Engine-side session state for the gesture in progress. Only the fields for
// the current kind are meaningful. Offsets are container-relative.
struct GestureSession {
  GestureKind kind{GestureKind::None};

  // Pan
  double startX{0}, startY{0};

  // Pinch
  double initialDistance{0};
  double anchorOffsetX{0}, anchorOffsetY{0};
  double centerX{0}, centerY{0};   // midpoint at pinch start

  bool active() const { return kind != GestureKind::None; }
};

} // namespace pz
