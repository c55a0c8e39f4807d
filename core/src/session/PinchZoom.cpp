#include "pz/session/PinchZoom.hpp"
#include "pz/transform/StateSnapshot.hpp"

#include <cstdio>

namespace pz {

PinchZoom::~PinchZoom() {
  if (input_) input_->removeSink(this);
}

ZoomResult PinchZoom::init(const ZoomConfig& cfg, GeometryProvider* geometry,
                           TaskScheduler* scheduler, InputSource* input) {
  if (engine_.isInitialized()) teardown();

  ZoomResult r = engine_.init(cfg, geometry, scheduler);
  if (!r.ok) return r;

  GestureClassifierConfig cc;
  cc.doubleTapWindowMs = cfg.doubleTapWindowMs;
  cc.doubleTapMaxOffsetPx = cfg.doubleTapMaxOffsetPx;
  cc.moveThresholdPx = cfg.moveThresholdPx;
  classifier_.setConfig(cc);
  classifier_.reset();

  gestureCount_ = 0;
  if (input) {
    input_ = input;
    input_->addSink(this);
  }
  return r;
}

void PinchZoom::teardown() {
  if (input_) {
    input_->removeSink(this);
    input_ = nullptr;
  }
  classifier_.reset();
  engine_.teardown();
}

void PinchZoom::setEnabled(bool enabled) {
  if (enabled_ == enabled) return;
  enabled_ = enabled;
  // Drop half-seen touches so re-enabling starts clean.
  if (!enabled_) classifier_.reset();
}

void PinchZoom::onPress(const PointerEvent& ev) {
  if (!enabled_ || !engine_.isInitialized()) return;
  dispatch(classifier_.onPress(ev), ev.device);
}

void PinchZoom::onMove(const PointerEvent& ev) {
  if (!enabled_ || !engine_.isInitialized()) return;
  dispatch(classifier_.onMove(ev), ev.device);
}

void PinchZoom::onRelease(const PointerEvent& ev) {
  if (!enabled_ || !engine_.isInitialized()) return;
  dispatch(classifier_.onRelease(ev), ev.device);
}

void PinchZoom::onWheel(const WheelEvent& ev) {
  if (!enabled_ || !engine_.isInitialized()) return;
  std::vector<GestureEvent> events{classifier_.onWheel(ev)};
  dispatch(events, PointerDevice::Mouse);
}

void PinchZoom::dispatch(const std::vector<GestureEvent>& events, PointerDevice device) {
  const ZoomConfig& cfg = engine_.config();

  for (GestureEvent g : events) {
    g.fromMouse = device == PointerDevice::Mouse;
    gestureCount_++;
    lastGesture_ = g;

    bool mouseClick = device == PointerDevice::Mouse && cfg.clickToZoomEnabled &&
                      (g.type == GestureEventType::Tap ||
                       g.type == GestureEventType::DoubleTap);
    if (mouseClick) {
      engine_.zoomToPoint(g.x0, g.y0, cfg.clickToZoomScale);
      continue;
    }

    ZoomResult r = engine_.handleGesture(g);
    if (!r.ok) {
      std::fprintf(stderr, "PinchZoom: %s dropped: %s\n", toString(g.type),
                   r.err.message.c_str());
    }
  }
}

ZoomResult PinchZoom::clickAt(double clientX, double clientY) {
  if (!engine_.isInitialized())
    return makeError("NOT_INITIALIZED", "PinchZoom::clickAt: not initialized");
  if (!engine_.config().clickToZoomEnabled)
    return makeError("DISABLED", "PinchZoom::clickAt: click-to-zoom is disabled");
  return engine_.zoomToPoint(clientX, clientY, engine_.config().clickToZoomScale);
}

std::string PinchZoom::snapshotJson() const {
  return serializeTransformState(engine_.extendedState());
}

ZoomResult PinchZoom::restoreJson(const std::string& json) {
  ExtendedTransformState s;
  ZoomResult r = deserializeTransformState(json, s);
  if (!r.ok) {
    std::fprintf(stderr, "PinchZoom::restoreJson: %s\n", r.err.message.c_str());
    return r;
  }
  return engine_.restoreTransform(s.scale, s.translateX, s.translateY);
}

} // namespace pz
