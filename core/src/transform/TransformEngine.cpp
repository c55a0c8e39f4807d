#include "pz/transform/TransformEngine.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace pz {

TransformEngine::~TransformEngine() {
  // No publishing here: listeners may already be gone.
  cancelMaxScalePoll();
}

ZoomResult TransformEngine::notInitialized(const char* op) const {
  std::fprintf(stderr, "TransformEngine::%s: engine not initialized\n", op);
  return makeError("NOT_INITIALIZED", std::string("TransformEngine::") + op +
                                          ": engine not initialized");
}

ZoomResult TransformEngine::init(const ZoomConfig& cfg, GeometryProvider* geometry,
                                 TaskScheduler* scheduler) {
  if (!geometry) {
    std::fprintf(stderr, "TransformEngine::init: missing geometry provider\n");
    return makeError("MISSING_GEOMETRY", "TransformEngine::init: geometry provider is required");
  }
  ZoomResult v = validateZoomConfig(cfg);
  if (!v.ok) {
    std::fprintf(stderr, "TransformEngine::init: %s\n", v.err.message.c_str());
    return v;
  }

  if (initialized_) teardown();

  config_ = cfg;
  geometry_ = geometry;
  scheduler_ = scheduler;

  constraints_.minScale = cfg.minScale;
  constraints_.panEnabled = cfg.panEnabled;
  constraints_.panClampEnabled = cfg.panClampEnabled;
  constraints_.minScaleForPan = cfg.minScaleForPan;
  constraints_.pinchDragEnabled = cfg.draggableOnPinch;
  if (cfg.maxScaleMode == MaxScaleMode::Fixed) {
    constraints_.maxScale = cfg.maxScale;
    maxScaleResolved_ = true;
  } else {
    constraints_.maxScale = cfg.defaultMaxScale;
    maxScaleResolved_ = false;
  }

  state_ = TransformState{};
  session_ = GestureSession{};
  initialized_ = true;

  if (!maxScaleResolved_ && !tryResolveMaxScale()) startMaxScalePoll();
  return makeOk(state_.scale);
}

void TransformEngine::teardown() {
  if (!initialized_) return;
  cancelMaxScalePoll();
  session_ = GestureSession{};

  double prev = state_.scale;
  state_.reset();
  publish(UpdateReason::Teardown, false, prev);

  geometry_ = nullptr;
  scheduler_ = nullptr;
  initialized_ = false;
}

// ---- Gestures ----

ZoomResult TransformEngine::handleGesture(const GestureEvent& ev) {
  if (!initialized_) return notInitialized("handleGesture");

  GeometrySnapshot g = geometry_->snapshot();

  switch (ev.type) {
    case GestureEventType::PanStart:  beginPan(ev, g); break;
    case GestureEventType::PanMove:   movePan(ev, g); break;
    case GestureEventType::PinchStart: beginPinch(ev, g); break;
    case GestureEventType::PinchMove: movePinch(ev, g); break;
    case GestureEventType::PanEnd:
    case GestureEventType::PinchEnd:
      settle(g);
      break;
    case GestureEventType::DoubleTap:
      if (config_.doubleTapEnabled && !session_.active()) {
        return toggleZoomAt(ev.x0, ev.y0);
      }
      break;
    case GestureEventType::Wheel:
      if (config_.wheelEnabled) wheel(ev, g);
      break;
    case GestureEventType::Tap:
    default:
      break;
  }
  return makeOk(state_.scale);
}

void TransformEngine::beginPan(const GestureEvent& ev, const GeometrySnapshot& g) {
  session_ = GestureSession{};
  session_.kind = GestureKind::Pan;
  session_.startX = ev.x0 - g.container.left;
  session_.startY = ev.y0 - g.container.top;
}

void TransformEngine::beginPinch(const GestureEvent& ev, const GeometrySnapshot& g) {
  session_ = GestureSession{};
  session_.kind = GestureKind::Pinch;
  session_.initialDistance = ev.distance;

  // Midpoint relative to the committed translate, fixed for the whole pinch.
  double midX = (ev.x0 + ev.x1) / 2.0 - g.container.left;
  double midY = (ev.y0 + ev.y1) / 2.0 - g.container.top;
  session_.anchorOffsetX = midX - state_.initialTranslateX;
  session_.anchorOffsetY = midY - state_.initialTranslateY;
  session_.centerX = midX;
  session_.centerY = midY;
}

void TransformEngine::movePan(const GestureEvent& ev, const GeometrySnapshot& g) {
  if (session_.kind != GestureKind::Pan) return;

  TransformState next = applyPan(state_, session_,
                                 ev.x0 - g.container.left, ev.y0 - g.container.top,
                                 constraints_, g);
  if (ev.fromMouse && constraints_.panEnabled && next.scale > constraints_.minScaleForPan) {
    alignToBounds(next, g);
  }
  if (next.translateX == state_.translateX && next.translateY == state_.translateY) return;

  double prev = state_.scale;
  state_ = next;
  publish(UpdateReason::Pan, false, prev);
}

void TransformEngine::movePinch(const GestureEvent& ev, const GeometrySnapshot& g) {
  if (session_.kind != GestureKind::Pinch) return;

  double prev = state_.scale;
  TransformState next = applyPinch(state_, session_, ev.distance,
                                   (ev.x0 + ev.x1) / 2.0 - g.container.left,
                                   (ev.y0 + ev.y1) / 2.0 - g.container.top,
                                   constraints_, g);
  if (next.scale == state_.scale && next.translateX == state_.translateX &&
      next.translateY == state_.translateY) {
    return;
  }
  state_ = next;
  publish(UpdateReason::Pinch, false, prev);
}

void TransformEngine::settle(const GeometrySnapshot& g) {
  if (!session_.active()) return;

  GestureKind kind = session_.kind;
  session_ = GestureSession{};

  double prevScale = state_.scale;
  double prevX = state_.translateX;
  double prevY = state_.translateY;

  // The max scale may have resolved while the gesture was running.
  bool clamped = limitZoom(state_, constraints_, g);

  if (kind == GestureKind::Pinch) {
    if (state_.scale < 1.0 || config_.autoZoomOut) state_.scale = 1.0;
    alignToBounds(state_, g);
  } else if (clamped || (kind == GestureKind::Pan && state_.scale > constraints_.minScaleForPan)) {
    alignToBounds(state_, g);
  }
  state_.commit();

  if (state_.scale != prevScale || state_.translateX != prevX || state_.translateY != prevY) {
    publish(clamped ? UpdateReason::MaxScaleResolved : UpdateReason::Settle, true, prevScale);
  }
}

void TransformEngine::wheel(const GestureEvent& ev, const GeometrySnapshot& g) {
  // Never commit in the middle of a touch or drag session.
  if (session_.active()) return;

  double target = wheelTargetScale(state_.initialScale, ev.wheelDelta,
                                   config_.wheelStep, constraints_.maxScale);
  target = clampScale(target, constraints_);
  if (std::fabs(target - state_.scale) < kScaleEpsilon) return;

  double anchorX = ev.x0 - g.container.left - state_.initialTranslateX;
  double anchorY = ev.y0 - g.container.top - state_.initialTranslateY;
  zoomCommitted(target, anchorX, anchorY, g, UpdateReason::Wheel);
}

// ---- Programmatic zoom ----

ZoomResult TransformEngine::zoomIn(double step) {
  if (!initialized_) return notInitialized("zoomIn");
  if (!std::isfinite(step) || step < 0.0)
    return makeError("INVALID_ARGUMENT", "TransformEngine::zoomIn: step must be >= 0");

  session_ = GestureSession{};
  GeometrySnapshot g = geometry_->snapshot();

  double target = state_.scale + step;
  if (target >= constraints_.maxScale) target = constraints_.maxScale;
  target = clampScale(target, constraints_);

  zoomCommitted(target,
                g.element.width / 2.0 - state_.initialTranslateX,
                g.element.height / 2.0 - state_.initialTranslateY,
                g, UpdateReason::StepZoom);
  return makeOk(state_.scale);
}

ZoomResult TransformEngine::zoomOut(double step) {
  if (!initialized_) return notInitialized("zoomOut");
  if (!std::isfinite(step) || step < 0.0)
    return makeError("INVALID_ARGUMENT", "TransformEngine::zoomOut: step must be >= 0");

  session_ = GestureSession{};
  GeometrySnapshot g = geometry_->snapshot();

  double target = state_.scale - step;
  if (target <= constraints_.lowerBound()) target = constraints_.lowerBound();
  target = clampScale(target, constraints_);

  zoomCommitted(target,
                g.element.width / 2.0 - state_.initialTranslateX,
                g.element.height / 2.0 - state_.initialTranslateY,
                g, UpdateReason::StepZoom);
  return makeOk(state_.scale);
}

ZoomResult TransformEngine::toggleZoom() {
  if (!initialized_) return notInitialized("toggleZoom");

  session_ = GestureSession{};
  if (!isRestScale(state_.scale)) {
    resetCommitted(UpdateReason::Toggle);
    return makeOk(state_.scale);
  }

  GeometrySnapshot g = geometry_->snapshot();
  double target = clampScale(1.0 + config_.stepZoomScale, constraints_);
  zoomCommitted(target,
                g.element.width / 2.0 - state_.initialTranslateX,
                g.element.height / 2.0 - state_.initialTranslateY,
                g, UpdateReason::Toggle);
  return makeOk(state_.scale);
}

ZoomResult TransformEngine::toggleZoomAt(double clientX, double clientY) {
  if (!initialized_) return notInitialized("toggleZoomAt");

  session_ = GestureSession{};
  if (!isRestScale(state_.scale)) {
    resetCommitted(UpdateReason::DoubleTap);
    return makeOk(state_.scale);
  }

  GeometrySnapshot g = geometry_->snapshot();
  double target = clampScale(config_.doubleTapScale, constraints_);
  zoomCommitted(target,
                clientX - g.container.left - state_.initialTranslateX,
                clientY - g.container.top - state_.initialTranslateY,
                g, UpdateReason::DoubleTap);
  return makeOk(state_.scale);
}

ZoomResult TransformEngine::zoomToPoint(double clientX, double clientY, double targetScale) {
  if (!initialized_) return notInitialized("zoomToPoint");
  if (!std::isfinite(targetScale) || targetScale <= 0.0)
    return makeError("INVALID_ARGUMENT", "TransformEngine::zoomToPoint: targetScale must be > 0");

  session_ = GestureSession{};

  // Binary: a click while zoomed (or already at the target) goes back to rest.
  if (state_.scale >= targetScale || state_.scale > 1.0 + kScaleEpsilon) {
    resetCommitted(UpdateReason::PointZoom);
    return makeOk(state_.scale);
  }

  GeometrySnapshot g = geometry_->snapshot();
  double target = clampScale(targetScale, constraints_);
  zoomCommitted(target,
                clientX - g.container.left - state_.initialTranslateX,
                clientY - g.container.top - state_.initialTranslateY,
                g, UpdateReason::PointZoom);
  return makeOk(state_.scale);
}

ZoomResult TransformEngine::resetZoom() {
  if (!initialized_) return notInitialized("resetZoom");
  session_ = GestureSession{};
  resetCommitted(UpdateReason::Reset);
  return makeOk(state_.scale);
}

ZoomResult TransformEngine::restoreTransform(double scale, double translateX, double translateY) {
  if (!initialized_) return notInitialized("restoreTransform");
  if (!std::isfinite(scale) || !std::isfinite(translateX) || !std::isfinite(translateY))
    return makeError("INVALID_ARGUMENT", "TransformEngine::restoreTransform: non-finite value");

  session_ = GestureSession{};
  double prev = state_.scale;
  state_.scale = clampScale(scale, constraints_);
  state_.translateX = translateX;
  state_.translateY = translateY;
  if (constraints_.panClampEnabled) limitPan(state_, geometry_->snapshot());
  state_.commit();
  publish(UpdateReason::Restore, false, prev);
  return makeOk(state_.scale);
}

void TransformEngine::zoomCommitted(double target, double anchorX, double anchorY,
                                    const GeometrySnapshot& g, UpdateReason reason) {
  double prev = state_.scale;
  state_ = zoomAround(state_, target, anchorX, anchorY);
  alignToBounds(state_, g);
  state_.commit();
  publish(reason, true, prev);
}

void TransformEngine::resetCommitted(UpdateReason reason) {
  double prev = state_.scale;
  state_.reset();
  publish(reason, true, prev);
}

// ---- Natural-resolution max scale ----

ZoomResult TransformEngine::redetectMaxScale() {
  if (!initialized_) return notInitialized("redetectMaxScale");
  if (config_.maxScaleMode != MaxScaleMode::FitNatural) return makeOk(state_.scale);

  cancelMaxScalePoll();
  maxScaleResolved_ = false;
  if (!tryResolveMaxScale()) startMaxScalePoll();
  return makeOk(state_.scale);
}

bool TransformEngine::tryResolveMaxScale() {
  if (!geometry_) return false;
  GeometrySnapshot g = geometry_->snapshot();
  if (g.natural.width <= 0.0 || g.content.width <= 0.0) return false;

  double resolved = g.natural.width / g.content.width;
  constraints_.maxScale = std::max({resolved, 1.0, constraints_.minScale});
  maxScaleResolved_ = true;

  // Content smaller than its natural size may already be zoomed past the new limit.
  if (state_.scale > constraints_.maxScale && !session_.active()) {
    double prev = state_.scale;
    limitZoom(state_, constraints_, g);
    alignToBounds(state_, g);
    state_.commit();
    publish(UpdateReason::MaxScaleResolved, true, prev);
  }
  return true;
}

void TransformEngine::startMaxScalePoll() {
  if (!scheduler_ || pollHandle_ != kInvalidTask) return;
  pollHandle_ = scheduler_->scheduleRepeating(config_.naturalPollIntervalMs, [this]() {
    if (!tryResolveMaxScale()) return true;
    pollHandle_ = kInvalidTask;
    return false;
  });
}

void TransformEngine::cancelMaxScalePoll() {
  if (pollHandle_ == kInvalidTask) return;
  if (scheduler_) scheduler_->cancel(pollHandle_);
  pollHandle_ = kInvalidTask;
}

// ---- Queries ----

ExtendedTransformState TransformEngine::extendedState() const {
  ExtendedTransformState e;
  e.scale = state_.scale;
  e.translateX = state_.translateX;
  e.translateY = state_.translateY;
  e.isZoomedIn = state_.scale > 1.0 + kScaleEpsilon;
  e.atMaxScale = state_.scale >= constraints_.maxScale - kScaleEpsilon;
  e.atMinScale = state_.scale <= constraints_.lowerBound() + kScaleEpsilon;
  e.canZoomIn = !e.atMaxScale;
  e.canZoomOut = !e.atMinScale;
  return e;
}

bool TransformEngine::isDragging() const {
  if (!initialized_) return false;
  return pz::isDragging(state_, constraints_, geometry_->snapshot());
}

void TransformEngine::publish(UpdateReason reason, bool animate, double previousScale) {
  TransformUpdate u;
  u.scale = state_.scale;
  u.translateX = state_.translateX;
  u.translateY = state_.translateY;
  u.scaleChanged = state_.scale != previousScale;
  u.animate = animate;
  u.durationMs = animate ? config_.transitionDurationMs : 0;
  u.reason = reason;
  channel_.publish(u);
}

} // namespace pz
