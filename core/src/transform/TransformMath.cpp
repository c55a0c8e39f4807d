#include "pz/transform/TransformMath.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>

namespace pz {

namespace {

const double kRestEpsilon = 1e-6;

double* translateRef(TransformState& s, Axis a) {
  return a == Axis::X ? &s.translateX : &s.translateY;
}

} // namespace

double clampScale(double scale, const Constraints& c) {
  return std::min(std::max(scale, c.lowerBound()), c.maxScale);
}

bool isRestScale(double scale) {
  return std::fabs(scale - 1.0) < kRestEpsilon;
}

double limitPanAxis(double translate, double scale,
                    double containerSize, double elementSize, double contentSize) {
  double scaledContent = contentSize * scale;
  if (scaledContent < containerSize) {
    return (containerSize - elementSize * scale) / 2.0;
  }

  // Content smaller than the element sits centered inside it; this is the
  // negated inset of its leading edge from the element origin.
  double contentOffset = ((contentSize - elementSize) * scale) / 2.0;
  if (translate > contentOffset) {
    return contentOffset;
  }
  double overflow = scaledContent + std::fabs(contentOffset) - containerSize;
  if (overflow + translate < 0.0) {
    return -overflow;
  }
  return translate;
}

void limitPan(TransformState& s, const GeometrySnapshot& g) {
  for (Axis a : {Axis::Y, Axis::X}) {
    double* t = translateRef(s, a);
    *t = limitPanAxis(*t, s.scale, g.containerSize(a), g.elementSize(a), g.contentSize(a));
  }
}

bool limitZoom(TransformState& s, const Constraints& c, const GeometrySnapshot& g) {
  double lo = c.lowerBound();
  double hi = c.maxScale;
  if (s.scale >= lo && s.scale <= hi) return false;

  // Position ratio against the current overflow, captured before the clamp.
  double ratio[2] = {0.0, 0.0};
  bool hasRatio[2] = {false, false};
  const Axis axes[2] = {Axis::X, Axis::Y};
  for (int i = 0; i < 2; i++) {
    double unscaled = g.contentSize(axes[i]);
    double excess = unscaled * s.scale - unscaled;
    if (std::fabs(excess) > kScaleEpsilon) {
      ratio[i] = *translateRef(s, axes[i]) / excess;
      hasRatio[i] = true;
    }
  }

  s.scale = clampScale(s.scale, c);

  for (int i = 0; i < 2; i++) {
    if (!hasRatio[i]) continue; // zero-size geometry: leave this axis alone
    double unscaled = g.contentSize(axes[i]);
    *translateRef(s, axes[i]) = ratio[i] * (unscaled * s.scale - unscaled);
  }
  return true;
}

bool alignToBounds(TransformState& s, const GeometrySnapshot& g) {
  double oldX = s.translateX;
  double oldY = s.translateY;

  if (s.translateY > 0.0) s.translateY = 0.0;
  if (s.translateX > 0.0) s.translateX = 0.0;
  limitPan(s, g);

  return oldX != s.translateX || oldY != s.translateY;
}

TransformState applyPan(const TransformState& s, const GestureSession& session,
                        double pointerX, double pointerY,
                        const Constraints& c, const GeometrySnapshot& g) {
  if (!c.panEnabled || s.scale < c.minScaleForPan) return s;
  if (session.kind != GestureKind::Pan) return s;

  TransformState out = s;
  out.translateX = s.initialTranslateX + (pointerX - session.startX);
  out.translateY = s.initialTranslateY + (pointerY - session.startY);

  if (c.panClampEnabled) limitPan(out, g);
  return out;
}

TransformState applyPinch(const TransformState& s, const GestureSession& session,
                          double currentDistance, double midX, double midY,
                          const Constraints& c, const GeometrySnapshot& g) {
  if (session.kind != GestureKind::Pinch || session.initialDistance <= 0.0) return s;

  double r = currentDistance / session.initialDistance;

  TransformState out = s;
  out.scale = s.initialScale * r;
  out.translateX = compensate(s.initialTranslateX, session.anchorOffsetX, r);
  out.translateY = compensate(s.initialTranslateY, session.anchorOffsetY, r);
  if (c.pinchDragEnabled) {
    out.translateX += midX - session.centerX;
    out.translateY += midY - session.centerY;
  }

  limitZoom(out, c, g);
  if (c.panClampEnabled) limitPan(out, g);
  return out;
}

TransformState zoomAround(const TransformState& s, double newScale,
                          double anchorOffsetX, double anchorOffsetY) {
  TransformState out = s;
  double ratio = (s.initialScale > 0.0) ? newScale / s.initialScale : 1.0;
  out.scale = newScale;
  out.translateX = compensate(s.initialTranslateX, anchorOffsetX, ratio);
  out.translateY = compensate(s.initialTranslateY, anchorOffsetY, ratio);
  return out;
}

double wheelTargetScale(double committedScale, double wheelDelta,
                        double step, double maxScale) {
  if (wheelDelta == 0.0) return committedScale;

  double newScale = committedScale + (wheelDelta < 0.0 ? step : -step);
  if (newScale < 1.0 + step - kScaleEpsilon) {
    newScale = 1.0;
  } else if (newScale > maxScale - step + kScaleEpsilon) {
    newScale = maxScale;
  }
  return newScale;
}

bool isDragging(const TransformState& s, const Constraints& c, const GeometrySnapshot& g) {
  if (!c.panEnabled) return false;
  return g.content.width * s.scale > g.container.width ||
         g.content.height * s.scale > g.container.height;
}

} // namespace pz
