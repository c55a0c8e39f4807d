#pragma once
#include "pz/geometry/Geometry.hpp"
#include "pz/gesture/GestureEvent.hpp"
#include "pz/transform/TransformState.hpp"

namespace pz {

inline constexpr double kScaleEpsilon = 1e-9;
inline constexpr double kMinimumScale = 0.01;   // scale must stay > 0 even when minScale is 0

// Resolved limits for one engine. maxScale is already a number here.
struct Constraints {
  double minScale{0.0};
  double maxScale{3.0};
  bool panEnabled{true};
  bool panClampEnabled{false};
  double minScaleForPan{1.0001};
  bool pinchDragEnabled{false};   // midpoint movement pans during a pinch

  double lowerBound() const { return minScale > kMinimumScale ? minScale : kMinimumScale; }
};

double clampScale(double scale, const Constraints& c);

bool isRestScale(double scale);

// Fixed-point zoom: new translate that keeps the point at `anchorOffset` from
// the committed translate on the same content pixel after scaling by `ratio`.
//   T2 = T1 - anchorOffset * (ratio - 1)
inline double compensate(double committedTranslate, double anchorOffset, double ratio) {
  return committedTranslate - anchorOffset * (ratio - 1.0);
}

// Pan clamp for one axis. Centers content smaller than the container,
// otherwise keeps both content edges from receding past the container edges.
double limitPanAxis(double translate, double scale,
                    double containerSize, double elementSize, double contentSize);

void limitPan(TransformState& s, const GeometrySnapshot& g);

// Scale clamp for pinch. Translate is re-derived so the content keeps the same
// position relative to its own overflow. Returns true if the scale was clamped.
bool limitZoom(TransformState& s, const Constraints& c, const GeometrySnapshot& g);

// Post-gesture alignment: positive offsets pulled back to 0, then pan clamp.
// Returns true if translate moved.
bool alignToBounds(TransformState& s, const GeometrySnapshot& g);

// Update rules. All positions are container-relative pixels.
TransformState applyPan(const TransformState& s, const GestureSession& session,
                        double pointerX, double pointerY,
                        const Constraints& c, const GeometrySnapshot& g);

// midX/midY: current midpoint of the two contacts.
TransformState applyPinch(const TransformState& s, const GestureSession& session,
                          double currentDistance, double midX, double midY,
                          const Constraints& c, const GeometrySnapshot& g);

// Scale from the committed baseline to `newScale`, anchored at a point given as
// an offset from the committed translate. Does not clamp.
TransformState zoomAround(const TransformState& s, double newScale,
                          double anchorOffsetX, double anchorOffsetY);

// Wheel target from the committed scale: +/- step, snapped to 1 when it lands
// within one step above rest and to maxScale within one step of it.
double wheelTargetScale(double committedScale, double wheelDelta,
                        double step, double maxScale);

bool isDragging(const TransformState& s, const Constraints& c, const GeometrySnapshot& g);

} // namespace pz
